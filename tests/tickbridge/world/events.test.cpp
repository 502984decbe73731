#include <tickbridge/world/events.hpp>

#include "../../tickbridge_test_common.hpp"

#include <memory>
#include <string>
#include <vector>

namespace tickbridge::world
{

namespace
{

std::vector<std::string> readAll(EventReader<std::string> &reader, const Events<std::string> &events)
{
	std::vector<std::string> result;
	for (const std::string &value : reader.read(events)) {
		result.push_back(value);
	}
	return result;
}

} // namespace

TEST_CASE("'Events' test case 1", "[tickbridge::world::events]")
{
	Events<std::string> events;
	EventReader<std::string> reader;

	CHECK(events.empty());
	CHECK(events.send("a") == 0);
	CHECK(events.send("b") == 1);
	CHECK(events.len() == 2);

	CHECK(readAll(reader, events) == std::vector<std::string> { "a", "b" });
	// Each event is read once
	CHECK(readAll(reader, events).empty());

	// Readable during the next update too
	events.update();
	CHECK(events.len() == 2);
	events.send("c");

	EventReader<std::string> late_reader;
	CHECK(late_reader.unread(events) == 3);
	CHECK(readAll(late_reader, events) == std::vector<std::string> { "a", "b", "c" });
	CHECK(readAll(reader, events) == std::vector<std::string> { "c" });

	// Gone after the second update
	events.update();
	CHECK(events.len() == 1);
	CHECK(events.oldestId() == 2);

	events.update();
	CHECK(events.empty());
	CHECK(events.oldestId() == events.nextId());
	CHECK(readAll(reader, events).empty());
}

TEST_CASE("'Events' test case 2", "[tickbridge::world::events]")
{
	Events<std::string> events;
	EventReader<std::string> slow_reader;

	events.send("x");
	events.update();
	events.update();
	events.send("y");

	// "x" expired before the reader got to it
	CHECK(slow_reader.unread(events) == 1);
	CHECK(readAll(slow_reader, events) == std::vector<std::string> { "y" });
	CHECK(slow_reader.cursor() == events.nextId());

	auto fresh = EventReader<std::string>::startingAfter(events);
	CHECK(fresh.unread(events) == 0);
	events.send("z");
	CHECK(readAll(fresh, events) == std::vector<std::string> { "z" });

	events.clear();
	CHECK(events.empty());
	CHECK(events.nextId() == 3);
}

TEST_CASE("'Events' test case 3", "[tickbridge::world::events]")
{
	auto old_events = std::make_unique<Events<std::string>>();
	EventReader<std::string> reader;

	for (int i = 0; i < 5; i++) {
		old_events->send("old");
	}
	CHECK(readAll(reader, *old_events).size() == 5);
	REQUIRE(reader.cursor() == 5);

	// Store is replaced, ids start over behind the reader's cursor
	auto new_events = std::make_unique<Events<std::string>>();
	new_events->send("p");
	new_events->send("q");

	CHECK(reader.unread(*new_events) == 2);
	CHECK(readAll(reader, *new_events) == std::vector<std::string> { "p", "q" });
	CHECK(reader.cursor() == new_events->nextId());

	Events<std::string> empty_events;
	EventReader<std::string> ahead_reader = EventReader<std::string>::startingAfter(*old_events);
	CHECK(ahead_reader.unread(empty_events) == 0);
	CHECK(readAll(ahead_reader, empty_events).empty());
	CHECK(ahead_reader.cursor() == 0);
}

} // namespace tickbridge::world
