#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/task_waker.hpp>
#include <tickbridge/visibility.hpp>
#include <tickbridge/world/tick_id.hpp>

#include <atomic>
#include <coroutine>
#include <vector>

namespace tickbridge::bridge
{

// Counter of elapsed world ticks with a coalescing change notification.
//
// Waiters are not queued per tick: an `advance()` wakes every task
// registered so far and they only ever observe the latest value.
// Any thread can read and wait, only the pump thread may advance.
class TICKBRIDGE_API TickClock {
public:
	// Awaitable returned by `waitForChange()`. Resumes with the tick value
	// observed after the change. Throws `Exception` with `BridgeErrc::ClockClosed`
	// if the clock was closed instead.
	class ChangeAwaitable {
	public:
		ChangeAwaitable(TickClock &clock, world::TickId seen) noexcept : m_clock(clock), m_seen(seen) {}

		bool await_ready() const noexcept { return m_clock.changedOrClosed(m_seen); }

		template<typename P>
		bool await_suspend(std::coroutine_handle<P> handle) noexcept
		{
			return m_clock.tryRegisterWaiter(m_seen, handle.promise().taskHeader(), handle);
		}

		world::TickId await_resume() const;

	private:
		TickClock &m_clock;
		world::TickId m_seen;
	};

	TickClock() = default;
	// Start counting from `start` instead of zero
	explicit TickClock(world::TickId start) noexcept : m_counter(start.value) {}
	TickClock(TickClock &&) = delete;
	TickClock(const TickClock &) = delete;
	TickClock &operator=(TickClock &&) = delete;
	TickClock &operator=(const TickClock &) = delete;
	// Closes the clock if it was not closed yet
	~TickClock();

	// Increment the counter (wrapping) and wake every registered waiter.
	// Returns the new value. Must be called only by the pump thread.
	world::TickId advance();
	// Lock-free read, any thread. The value may be outdated as soon as it is returned.
	world::TickId current() const noexcept { return world::TickId(m_counter.load(std::memory_order_acquire)); }

	// Suspend the calling task until the tick differs from `seen`
	// (or the clock is closed). Ready immediately if it already differs.
	ChangeAwaitable waitForChange(world::TickId seen) noexcept { return ChangeAwaitable(*this, seen); }
	// Suspend until the next `advance()` after this call
	ChangeAwaitable waitForChange() noexcept { return ChangeAwaitable(*this, current()); }

	// Mark closed and wake every waiter, they will throw `BridgeErrc::ClockClosed`.
	// Advancing a closed clock still works but nobody can wait on it anymore.
	void close();
	bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }

	// Approximate number of tasks currently waiting
	size_t numWaiters() const noexcept;

private:
	std::atomic_uint64_t m_counter = 0;
	std::atomic_bool m_closed = false;

	mutable os::FutexLock m_waiters_lock;
	// Protected by `m_waiters_lock`
	std::vector<svc::TaskWaker> m_waiters;

	bool changedOrClosed(world::TickId seen) const noexcept;
	// Returns false (don't suspend) if the condition became true before registering
	bool tryRegisterWaiter(world::TickId seen, svc::detail::TaskHeader *header,
		std::coroutine_handle<> resume_point) noexcept;
	void wakeAll();
};

} // namespace tickbridge::bridge
