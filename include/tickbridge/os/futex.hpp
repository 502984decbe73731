#pragma once

#include <tickbridge/visibility.hpp>

#include <atomic>
#include <cstdint>

namespace tickbridge::os
{

// Raw futex operations for building custom synchronization primitives
namespace Futex
{

// Block the thread until value at `addr` changes to something other than `value`.
// Can return spuriously, the caller is expected to re-check its condition in a loop.
TICKBRIDGE_API void waitInfinite(std::atomic_uint32_t *addr, uint32_t value) noexcept;

// Wake at least one thread (if any) waiting on `addr`
TICKBRIDGE_API void wakeSingle(std::atomic_uint32_t *addr) noexcept;

// Wake all threads (if any) waiting on `addr`
TICKBRIDGE_API void wakeAll(std::atomic_uint32_t *addr) noexcept;

} // namespace Futex

// A lightweight alternative to `std::mutex` (4 bytes versus ~40-80).
// Satisfies `Lockable`, so works with `std::lock_guard` and `std::unique_lock`.
// Every queue and waiter list in this library is guarded by one of these.
class TICKBRIDGE_API FutexLock {
public:
	FutexLock() = default;
	FutexLock(FutexLock &&) = delete;
	FutexLock(const FutexLock &) = delete;
	FutexLock &operator=(FutexLock &&) = delete;
	FutexLock &operator=(const FutexLock &) = delete;
	~FutexLock() = default;

	void lock() noexcept;
	bool try_lock() noexcept;
	void unlock() noexcept;

private:
	// 0 - unlocked, 1 - locked, 2 - locked and someone might be waiting
	std::atomic_uint32_t m_payload = 0;
};

} // namespace tickbridge::os
