#include <tickbridge/bridge/channel_event_bridge.hpp>

#include <tickbridge/bridge/bridge_handle.hpp>

#include "../../tickbridge_test_common.hpp"

#include <string>
#include <utility>
#include <vector>

namespace tickbridge::bridge
{

namespace
{

struct Chat {
	std::string text;
};

template<typename T>
std::vector<T> readValues(world::EventReader<T> &reader, world::World &world)
{
	std::vector<T> result;
	for (const T &value : reader.read(world.events<T>())) {
		result.push_back(value);
	}
	return result;
}

// Event whose move constructor drains its own bridge again, i.e. re-enters the drain step
struct ReentrantEvent {
	static inline ChannelEventBridge<ReentrantEvent> *target_bridge = nullptr;
	static inline world::World *target_world = nullptr;

	ReentrantEvent() = default;
	ReentrantEvent(ReentrantEvent &&) noexcept
	{
		if (auto *b = std::exchange(target_bridge, nullptr); b) {
			b->drainStep(*target_world);
		}
	}
	ReentrantEvent(const ReentrantEvent &) = default;
	ReentrantEvent &operator=(ReentrantEvent &&) = default;
	ReentrantEvent &operator=(const ReentrantEvent &) = default;
	~ReentrantEvent() = default;
};

} // namespace

TEST_CASE("'ChannelEventBridge' test case 1", "[tickbridge::bridge::channel_event_bridge]")
{
	world::World world;
	world.initEvents<int>();

	auto [tx, rx] = svc::makeChannel<int>();
	ChannelEventBridge<int> bridge(std::move(rx));
	CHECK(bridge.eventType() == typeid(int));

	tx.send(1);
	tx.send(2);
	tx.send(3);

	CHECK(bridge.drainStep(world) == 3);
	CHECK(bridge.drainStep(world) == 0);
	CHECK(world.events<int>().len() == 3);

	CHECK_FALSE(bridge.channelClosed());
	tx = svc::Sender<int>();
	CHECK(bridge.channelClosed());
	// Draining a closed channel is fine, just publishes nothing
	CHECK(bridge.drainStep(world) == 0);
}

TEST_CASE("'ChannelEventBridge' test case 2", "[tickbridge::bridge::channel_event_bridge]")
{
	world::World world;
	BridgeHandle handle(world, BridgeHandle::Config { .task_service = { .num_threads = 1 } });

	auto [tx, rx] = svc::makeChannel<int>();
	handle.addEventChannel(std::move(rx));
	CHECK(world.hasResource<world::Events<int>>());

	world::EventReader<int> reader;

	tx.send(1);
	tx.send(2);
	tx.send(3);
	handle.tickPump();
	CHECK(readValues(reader, world) == std::vector<int> { 1, 2, 3 });

	// Nothing new, but the events are still stored for one more update
	handle.tickPump();
	CHECK(readValues(reader, world).empty());
	CHECK(world.events<int>().len() == 3);

	handle.tickPump();
	CHECK(world.events<int>().empty());

	tx.send(4);
	handle.tickPump();
	CHECK(readValues(reader, world) == std::vector<int> { 4 });
}

TEST_CASE("'ChannelEventBridge' test case 3", "[tickbridge::bridge::channel_event_bridge]")
{
	world::World world;
	BridgeHandle handle(world, BridgeHandle::Config { .task_service = { .num_threads = 1 } });

	auto [int_tx, int_rx] = svc::makeChannel<int>();
	auto [chat_tx, chat_rx] = svc::makeChannel<Chat>();
	auto [int_tx2, int_rx2] = svc::makeChannel<int>();

	handle.addEventChannel(std::move(int_rx)).addEventChannel(std::move(chat_rx));
	CHECK(handle.numEventChannels() == 2);

	CHECK_THROWS_MATCHES(handle.addEventChannel(std::move(int_rx2)), Exception,
		test::errcExceptionMatcher(BridgeErrc::DuplicateBridge));
	CHECK(handle.numEventChannels() == 2);

	world::EventReader<int> int_reader;
	world::EventReader<Chat> chat_reader;

	// Types drain independently of each other
	int_tx.send(10);
	handle.tickPump();
	CHECK(readValues(int_reader, world) == std::vector<int> { 10 });
	CHECK(readValues(chat_reader, world).empty());

	chat_tx.send(Chat { "hi" });
	chat_tx.send(Chat { "there" });
	handle.tickPump();
	CHECK(readValues(int_reader, world).empty());

	auto chats = readValues(chat_reader, world);
	REQUIRE(chats.size() == 2);
	CHECK(chats[0].text == "hi");
	CHECK(chats[1].text == "there");

	// The rejected receiver was dropped, its senders see a closed channel
	CHECK_FALSE(int_tx2.send(1));
}

TEST_CASE("'ChannelEventBridge' test case 4", "[tickbridge::bridge::channel_event_bridge]")
{
	bool aborted = test::abortsInChildProcess([] {
		world::World world;
		world.initEvents<ReentrantEvent>();

		auto [tx, rx] = svc::makeChannel<ReentrantEvent>();
		ChannelEventBridge<ReentrantEvent> bridge(std::move(rx));
		tx.send(ReentrantEvent());

		ReentrantEvent::target_bridge = &bridge;
		ReentrantEvent::target_world = &world;
		bridge.drainStep(world);
	});

	CHECK(aborted);
}

TEST_CASE("'ChannelEventBridge' test case 5", "[tickbridge::bridge::channel_event_bridge]")
{
	world::World world;

	{
		BridgeHandle first(world, BridgeHandle::Config { .task_service = { .num_threads = 1 } });
		auto [tx, rx] = svc::makeChannel<int>();
		first.addEventChannel(std::move(rx));
	}

	// A type stays bridged for the lifetime of the world
	BridgeHandle second(world, BridgeHandle::Config { .task_service = { .num_threads = 1 } });
	auto [int_tx, int_rx] = svc::makeChannel<int>();
	CHECK_THROWS_MATCHES(second.addEventChannel(std::move(int_rx)), Exception,
		test::errcExceptionMatcher(BridgeErrc::DuplicateBridge));
	CHECK(second.numEventChannels() == 0);

	auto [chat_tx, chat_rx] = svc::makeChannel<Chat>();
	CHECK_NOTHROW(second.addEventChannel(std::move(chat_rx)));
	CHECK(second.numEventChannels() == 1);
}

} // namespace tickbridge::bridge
