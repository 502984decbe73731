#include <tickbridge/svc/task_service.hpp>

#include <tickbridge/svc/join_handle.hpp>
#include <tickbridge/svc/response_slot.hpp>
#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/svc/task_handle.hpp>

#include "../../tickbridge_test_common.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

namespace tickbridge::svc
{

namespace
{

CoroTask incrementTask(std::atomic_size_t *counter)
{
	counter->fetch_add(1);
	co_return;
}

CoroTask throwingTask()
{
	throw std::runtime_error("task failure");
	co_return;
}

CoroSubTask<int> addSubTask(int a, int b)
{
	co_return a + b;
}

CoroSubTask<int> throwingSubTask()
{
	throw Exception::fromError(BridgeErrc::ResponseLost, "sub-task failure");
	co_return 0;
}

CoroTask subTaskUser(int *result, bool *caught)
{
	*result = co_await addSubTask(40, 2);

	try {
		co_await throwingSubTask();
	}
	catch (const Exception &e) {
		*caught = (e.error() == BridgeErrc::ResponseLost);
	}
}

struct AwaitingTaskState {
	std::atomic_bool started = false;
	std::atomic_bool destroyed = false;
	std::atomic_int result = 0;
};

CoroTask awaitingTask(ResponseReceiver<int> rx, AwaitingTaskState *state)
{
	struct DestroyFlag {
		std::atomic_bool *flag;
		~DestroyFlag() { flag->store(true); }
	} guard { &state->destroyed };

	state->started.store(true);
	state->result.store(co_await rx);
}

CoroSubTask<int> valueAfterResponse(ResponseReceiver<int> rx, int add)
{
	int value = co_await rx;
	co_return value + add;
}

CoroSubTask<int> failingJob()
{
	throw std::runtime_error("job failure");
	co_return 0;
}

CoroTask joiningTask(JoinHandle<int> first, JoinHandle<int> second, std::atomic_int *sum, std::atomic_bool *second_failed)
{
	sum->store(co_await first);

	try {
		co_await second;
	}
	catch (const std::runtime_error &) {
		second_failed->store(true);
	}
}

CoroTask waitForTask(TaskHandle *other, std::atomic_bool *done)
{
	co_await *other;
	done->store(true);
}

} // namespace

TEST_CASE("'TaskService' test case 1", "[tickbridge::svc::task_service]")
{
	TaskService ts(TaskService::Config { .num_threads = 4 });
	CHECK(ts.numThreads() == 4);

	TaskHandle handles[16];
	std::atomic_size_t counter = 0;

	// Launch a bunch of independent tasks
	for (size_t i = 0; i < std::size(handles); i++) {
		handles[i] = ts.spawn(incrementTask(&counter));
		CHECK(handles[i].valid());
	}

	for (size_t i = 0; i < std::size(handles); i++) {
		handles[i].wait();
		CHECK(handles[i].finished());
		CHECK_FALSE(handles[i].cancelRequested());
		CHECK_NOTHROW(handles[i].rethrowIfFailed());
	}

	CHECK(counter.load() == std::size(handles));
	CHECK(test::waitUntil([&] { return ts.numLiveTasks() == 0; }));
}

TEST_CASE("'TaskService' test case 2", "[tickbridge::svc::task_service]")
{
	TaskService ts(TaskService::Config { .num_threads = 2 });

	SECTION("Unhandled exception is stored")
	{
		TaskHandle handle = ts.spawn(throwingTask());
		handle.wait();
		CHECK(handle.finished());
		CHECK_THROWS_AS(handle.rethrowIfFailed(), std::runtime_error);
	}

	SECTION("Sub-tasks return values and propagate exceptions")
	{
		int result = 0;
		bool caught = false;

		TaskHandle handle = ts.spawn(subTaskUser(&result, &caught));
		handle.wait();

		CHECK(result == 42);
		CHECK(caught);
		CHECK_NOTHROW(handle.rethrowIfFailed());
	}

	SECTION("Spawning an empty coroutine fails")
	{
		CHECK_THROWS_MATCHES(ts.spawn(CoroTask()), Exception, test::errcExceptionMatcher(std::errc::invalid_argument));
	}
}

TEST_CASE("'TaskService' test case 3", "[tickbridge::svc::task_service]")
{
	TaskService ts(TaskService::Config { .num_threads = 2 });
	AwaitingTaskState state;

	SECTION("Woken task resumes with the value")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		TaskHandle handle = ts.spawn(awaitingTask(std::move(rx), &state));

		CHECK(tx.send(7));
		handle.wait();

		CHECK(state.result.load() == 7);
		CHECK(state.destroyed.load());
	}

	SECTION("Cancelled task is destroyed without resuming")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		TaskHandle handle = ts.spawn(awaitingTask(std::move(rx), &state));

		// Let it enter the body, a frame cancelled before its first poll has no locals yet
		REQUIRE(test::waitUntil([&] { return state.started.load(); }));

		handle.cancel();
		CHECK(handle.cancelRequested());
		handle.wait();

		CHECK(handle.finished());
		CHECK(state.destroyed.load());
		CHECK(state.result.load() == 0);
		// Receiver died with the frame
		CHECK_FALSE(tx.send(5));
	}

	SECTION("Dropping the handle cancels the task")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		TaskHandle handle = ts.spawn(awaitingTask(std::move(rx), &state));
		REQUIRE(test::waitUntil([&] { return state.started.load(); }));

		handle.reset();
		CHECK_FALSE(handle.valid());

		CHECK(test::waitUntil([&] { return state.destroyed.load(); }));
		CHECK(state.result.load() == 0);
	}

	SECTION("Detached task keeps running")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		ts.spawn(awaitingTask(std::move(rx), &state)).detach();

		REQUIRE(test::waitUntil([&] { return state.started.load(); }));
		CHECK(tx.send(3));

		CHECK(test::waitUntil([&] { return state.result.load() == 3; }));
		CHECK(test::waitUntil([&] { return state.destroyed.load(); }));
	}
}

TEST_CASE("'TaskService' test case 4", "[tickbridge::svc::task_service]")
{
	AwaitingTaskState state;

	auto [tx, rx] = makeResponseSlot<int>();
	TaskHandle handle;

	{
		TaskService ts(TaskService::Config { .num_threads = 1 });
		handle = ts.spawn(awaitingTask(std::move(rx), &state));
		REQUIRE(test::waitUntil([&] { return state.started.load(); }));
		CHECK(ts.numLiveTasks() == 1);
		// Service is destroyed with a task still suspended
	}

	CHECK(handle.finished());
	CHECK(state.destroyed.load());
	CHECK(state.result.load() == 0);
	CHECK_FALSE(tx.send(1));
}

TEST_CASE("'JoinHandle' test case 1", "[tickbridge::svc::task_service]")
{
	TaskService ts(TaskService::Config { .num_threads = 2 });

	SECTION("Value is delivered after blocking wait")
	{
		JoinHandle<int> job = ts.spawn(addSubTask(20, 22));
		job.wait();

		CHECK(job.finished());
		CHECK(job.takeResult() == 42);
		// Taken only once
		CHECK_THROWS_MATCHES(job.takeResult(), Exception, test::errcExceptionMatcher(BridgeErrc::TaskCancelled));
	}

	SECTION("Another task awaits values and exceptions")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		JoinHandle<int> first = ts.spawn(valueAfterResponse(std::move(rx), 1));
		JoinHandle<int> second = ts.spawn(failingJob());

		std::atomic_int sum = 0;
		std::atomic_bool second_failed = false;
		TaskHandle joiner = ts.spawn(joiningTask(std::move(first), std::move(second), &sum, &second_failed));

		// Joiner is suspended on the first job, which waits for the response
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
		CHECK_FALSE(joiner.finished());

		CHECK(tx.send(99));
		joiner.wait();

		CHECK(sum.load() == 100);
		CHECK(second_failed.load());
		CHECK_NOTHROW(joiner.rethrowIfFailed());
	}

	SECTION("Cancelled job reports no result")
	{
		auto [tx, rx] = makeResponseSlot<int>();
		JoinHandle<int> job = ts.spawn(valueAfterResponse(std::move(rx), 0));

		job.cancel();
		job.wait();

		CHECK(job.finished());
		CHECK_THROWS_MATCHES(job.takeResult(), Exception, test::errcExceptionMatcher(BridgeErrc::TaskCancelled));
		CHECK_FALSE(tx.send(1));
	}

	SECTION("Plain task handle is awaitable")
	{
		AwaitingTaskState state;
		auto [tx, rx] = makeResponseSlot<int>();
		TaskHandle awaited = ts.spawn(awaitingTask(std::move(rx), &state));

		std::atomic_bool done = false;
		TaskHandle waiter = ts.spawn(waitForTask(&awaited, &done));

		REQUIRE(test::waitUntil([&] { return state.started.load(); }));
		std::this_thread::sleep_for(std::chrono::milliseconds(10));
		CHECK_FALSE(done.load());

		CHECK(tx.send(5));
		waiter.wait();

		CHECK(done.load());
		CHECK(awaited.finished());
		CHECK(state.result.load() == 5);
	}
}

} // namespace tickbridge::svc
