#include <tickbridge/svc/response_slot.hpp>

#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/svc/task_service.hpp>

#include "../../tickbridge_test_common.hpp"

#include <string>

namespace tickbridge::svc
{

namespace
{

CoroTask receiveTask(ResponseReceiver<std::string> rx, std::string *value, bool *lost)
{
	try {
		*value = co_await rx;
	}
	catch (const Exception &e) {
		*lost = (e.error() == BridgeErrc::ResponseLost);
	}
}

} // namespace

TEST_CASE("'ResponseSlot' test case 1", "[tickbridge::svc::response_slot]")
{
	TaskService ts(TaskService::Config { .num_threads = 1 });

	std::string value;
	bool lost = false;

	SECTION("Value sent before awaiting")
	{
		auto [tx, rx] = makeResponseSlot<std::string>();
		CHECK(tx.send("early"));
		CHECK_FALSE(tx.valid());

		TaskHandle handle = ts.spawn(receiveTask(std::move(rx), &value, &lost));
		handle.wait();
		CHECK(value == "early");
		CHECK_FALSE(lost);
	}

	SECTION("Value sent while the task is suspended")
	{
		auto [tx, rx] = makeResponseSlot<std::string>();
		TaskHandle handle = ts.spawn(receiveTask(std::move(rx), &value, &lost));
		std::this_thread::sleep_for(std::chrono::milliseconds(10));

		CHECK(tx.send("late"));
		handle.wait();
		CHECK(value == "late");
		CHECK_FALSE(lost);
	}

	SECTION("Dropped sender makes the receiver fail")
	{
		auto [tx, rx] = makeResponseSlot<std::string>();
		TaskHandle handle = ts.spawn(receiveTask(std::move(rx), &value, &lost));
		std::this_thread::sleep_for(std::chrono::milliseconds(10));

		tx = ResponseSender<std::string>();
		handle.wait();
		CHECK(value.empty());
		CHECK(lost);
	}
}

TEST_CASE("'ResponseSlot' test case 2", "[tickbridge::svc::response_slot]")
{
	auto [tx, rx] = makeResponseSlot<int>();
	CHECK(tx.valid());
	CHECK(rx.valid());

	// Nobody will receive it, not an error
	rx = ResponseReceiver<int>();
	CHECK_FALSE(tx.send(1));
	CHECK_FALSE(tx.valid());
	// Second send is a no-op
	CHECK_FALSE(tx.send(2));
}

} // namespace tickbridge::svc
