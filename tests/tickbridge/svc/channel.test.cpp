#include <tickbridge/svc/channel.hpp>

#include "../../tickbridge_test_common.hpp"

#include <string>
#include <thread>
#include <vector>

namespace tickbridge::svc
{

TEST_CASE("'Channel' test case 1", "[tickbridge::svc::channel]")
{
	auto [tx, rx] = makeChannel<std::string>();

	CHECK_FALSE(rx.tryReceive().has_value());
	CHECK_FALSE(rx.closed());

	CHECK(tx.send("v1"));
	CHECK(tx.send("v2"));
	CHECK(rx.size() == 2);

	CHECK(rx.tryReceive() == "v1");
	CHECK(rx.tryReceive() == "v2");
	CHECK_FALSE(rx.tryReceive().has_value());

	SECTION("Closed once all senders are gone and it's empty")
	{
		Sender<std::string> tx2 = tx;
		tx2.send("v3");
		tx = Sender<std::string>();
		CHECK_FALSE(rx.closed());

		tx2 = Sender<std::string>();
		// Still has an item
		CHECK_FALSE(rx.closed());
		CHECK(rx.tryReceive() == "v3");
		CHECK(rx.closed());
	}

	SECTION("Sending to a dropped receiver fails")
	{
		rx = Receiver<std::string>();
		CHECK(tx.closed());
		CHECK_FALSE(tx.send("lost"));
	}
}

TEST_CASE("'Channel' test case 2", "[tickbridge::svc::channel]")
{
	constexpr int NUM_PRODUCERS = 4;
	constexpr int NUM_VALUES = 1000;

	auto [tx, rx] = makeChannel<int>();

	std::vector<std::jthread> producers;
	for (int p = 0; p < NUM_PRODUCERS; p++) {
		producers.emplace_back([p, tx = tx]() mutable {
			for (int i = 0; i < NUM_VALUES; i++) {
				tx.send(p * NUM_VALUES + i);
			}
		});
	}
	tx = Sender<int>();

	// Values of each producer arrive in the order it sent them
	int last_seen[NUM_PRODUCERS] = { -1, -1, -1, -1 };
	int received = 0;

	while (!rx.closed()) {
		if (auto value = rx.tryReceive(); value) {
			int producer = *value / NUM_VALUES;
			int index = *value % NUM_VALUES;
			CHECK(index == last_seen[producer] + 1);
			last_seen[producer] = index;
			received++;
		}
	}

	CHECK(received == NUM_PRODUCERS * NUM_VALUES);
}

} // namespace tickbridge::svc
