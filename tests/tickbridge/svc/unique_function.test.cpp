#include <tickbridge/svc/unique_function.hpp>

#include "../../tickbridge_test_common.hpp"

#include <memory>
#include <string>

namespace tickbridge::svc
{

TEST_CASE("'UniqueFunction' test case 1", "[tickbridge::svc::unique_function]")
{
	UniqueFunction<int(int)> empty;
	CHECK_FALSE(empty);

	// Move-only capture
	auto ptr = std::make_unique<int>(10);
	UniqueFunction<int(int)> fn = [p = std::move(ptr)](int x) { return *p + x; };
	REQUIRE(fn);
	CHECK(fn(5) == 15);

	UniqueFunction<int(int)> moved = std::move(fn);
	REQUIRE(moved);
	CHECK(moved(1) == 11);

	// Mutable state survives between calls
	std::string log;
	UniqueFunction<void(const char *)> appender = [&log, calls = 0](const char *s) mutable {
		calls++;
		log += std::to_string(calls);
		log += s;
	};

	appender("a");
	appender("b");
	CHECK(log == "1a2b");
}

TEST_CASE("'UniqueFunction' test case 2", "[tickbridge::svc::unique_function]")
{
	auto counter = std::make_shared<int>(0);

	{
		UniqueFunction<void()> fn = [counter]() { (*counter)++; };
		fn();
		CHECK(counter.use_count() == 2);
	}

	// Captured state is destroyed together with the function
	CHECK(counter.use_count() == 1);
	CHECK(*counter == 1);
}

} // namespace tickbridge::svc
