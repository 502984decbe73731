#pragma once

#include <tickbridge/visibility.hpp>

#include <system_error>

namespace tickbridge
{

// This error code is supplemental to `tickbridge::Exception` and is
// intended to be tested and reacted on by exception handling.
enum class BridgeErrc : int {
	// A channel bridge for this event type is already registered on the world.
	// Setup-time misuse, not recoverable at runtime.
	DuplicateBridge = 1,
	// The world is being (or has been) torn down, main-thread work can't be accepted.
	// Tasks should stop requesting main-thread work.
	WorldUnavailable = 2,
	// The tick clock was closed while a task was sleeping on it.
	// This is an early wakeup, not a successful sleep.
	ClockClosed = 3,
	// A main-thread callback was destroyed without delivering its result
	// (e.g. it threw or the queue was closed before draining it)
	ResponseLost = 4,
	// A single-consumer invariant was violated (e.g. two threads driving one drain step)
	InvariantViolation = 5,
	// A configuration value is out of the allowed range or has a wrong type
	InvalidConfig = 6,
	// A world resource (or event store) was requested but was never inserted
	ResourceMissing = 7,
	// An awaited task was cancelled before producing its result
	TaskCancelled = 8,
};

// ADL-accessible factory for `std::error_condition { BridgeErrc }`
TICKBRIDGE_API std::error_condition make_error_condition(BridgeErrc errc) noexcept;

} // namespace tickbridge

namespace std
{

// Mark `BridgeErrc` as eligible for `std::error_condition`
template<>
struct is_error_condition_enum<tickbridge::BridgeErrc> : true_type {};

} // namespace std
