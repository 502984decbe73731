#include <tickbridge/bridge/main_thread_queue.hpp>

#include <tickbridge/world/world.hpp>

#include "../../tickbridge_test_common.hpp"

#include <memory>
#include <stdexcept>
#include <vector>

namespace tickbridge::bridge
{

TEST_CASE("'MainThreadQueue' test case 1", "[tickbridge::bridge::main_thread_queue]")
{
	world::World world;
	MainThreadQueue queue;

	std::vector<int> order;
	for (int i = 0; i < 5; i++) {
		queue.enqueue([&order, i](MainThreadContext &) { order.push_back(i); });
	}
	CHECK(queue.size() == 5);

	CHECK(queue.drainAll(world, world::TickId(1)) == 5);
	CHECK(order == std::vector<int> { 0, 1, 2, 3, 4 });
	CHECK(queue.size() == 0);
	CHECK(queue.drainAll(world, world::TickId(2)) == 0);
}

TEST_CASE("'MainThreadQueue' test case 2", "[tickbridge::bridge::main_thread_queue]")
{
	world::World world;
	MainThreadQueue queue;

	world::TickId seen_tick;
	world::World *seen_world = nullptr;
	bool later_ran = false;

	queue.enqueue([&](MainThreadContext &ctx) {
		seen_tick = ctx.current_tick;
		seen_world = &ctx.world;
	});
	queue.enqueue([](MainThreadContext &) { throw std::runtime_error("callback failure"); });
	queue.enqueue([&](MainThreadContext &) {
		later_ran = true;
		// Enqueued during the drain, runs in the same drain
		queue.enqueue([](MainThreadContext &ctx) { ctx.world.insertResource<int>(7); });
	});

	// Throwing callback is counted and does not stop the drain
	CHECK(queue.drainAll(world, world::TickId(42)) == 4);
	CHECK(seen_tick == world::TickId(42));
	CHECK(seen_world == &world);
	CHECK(later_ran);
	CHECK(world.resource<int>() == 7);
}

TEST_CASE("'MainThreadQueue' test case 3", "[tickbridge::bridge::main_thread_queue]")
{
	world::World world;
	MainThreadQueue queue(MainThreadQueue::Config { .max_callbacks_per_tick = 2 });
	CHECK(queue.config().max_callbacks_per_tick == 2);

	std::vector<int> order;
	for (int i = 0; i < 5; i++) {
		queue.enqueue([&order, i](MainThreadContext &) { order.push_back(i); });
	}

	// Excess stays queued for the next ticks, FIFO preserved
	CHECK(queue.drainAll(world, world::TickId(1)) == 2);
	CHECK(queue.size() == 3);
	CHECK(order == std::vector<int> { 0, 1 });

	CHECK(queue.drainAll(world, world::TickId(2)) == 2);
	CHECK(queue.drainAll(world, world::TickId(3)) == 1);
	CHECK(queue.drainAll(world, world::TickId(4)) == 0);
	CHECK(order == std::vector<int> { 0, 1, 2, 3, 4 });
}

TEST_CASE("'MainThreadQueue' test case 4", "[tickbridge::bridge::main_thread_queue]")
{
	world::World world;
	MainThreadQueue queue;

	auto captured = std::make_shared<int>(0);
	queue.enqueue([captured](MainThreadContext &) { (*captured)++; });
	CHECK(captured.use_count() == 2);

	queue.close();
	CHECK(queue.closed());
	// Pending callbacks are destroyed without running
	CHECK(captured.use_count() == 1);
	CHECK(*captured == 0);
	CHECK(queue.size() == 0);

	CHECK_THROWS_MATCHES(queue.enqueue([](MainThreadContext &) {}), Exception,
		test::errcExceptionMatcher(BridgeErrc::WorldUnavailable));
	CHECK(queue.drainAll(world, world::TickId(1)) == 0);
}

TEST_CASE("'MainThreadQueue' test case 5", "[tickbridge::bridge::main_thread_queue]")
{
	world::World world;
	MainThreadQueue queue;

	bool later_ran = false;
	queue.enqueue([](MainThreadContext &) { throw 42; });
	queue.enqueue([&](MainThreadContext &) { later_ran = true; });

	// Not derived from `std::exception`, still contained by the drain
	size_t executed = 0;
	CHECK_NOTHROW(executed = queue.drainAll(world, world::TickId(1)));
	CHECK(executed == 2);
	CHECK(later_ran);
	CHECK(queue.size() == 0);
}

} // namespace tickbridge::bridge
