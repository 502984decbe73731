#pragma once

#include <cstdint>

namespace tickbridge::world
{

// Monotonic update counter value. Arithmetic wraps around on overflow.
//
// No `<`/`>` operators: after a wraparound
// "bigger" is meaningless, compare distances (`a - b`) instead.
struct TickId {
	constexpr TickId() = default;
	constexpr explicit TickId(uint64_t v) noexcept : value(v) {}

	constexpr bool operator==(const TickId &) const noexcept = default;

	constexpr TickId operator+(uint64_t delta) const noexcept { return TickId(value + delta); }
	// Number of ticks from `other` to `this`, modulo 2^64
	constexpr uint64_t operator-(TickId other) const noexcept { return value - other.value; }

	constexpr TickId &operator++() noexcept
	{
		++value;
		return *this;
	}

	constexpr TickId operator++(int) noexcept
	{
		TickId prev = *this;
		++value;
		return prev;
	}

	uint64_t value = 0;
};

} // namespace tickbridge::world
