#include <tickbridge/bridge/tick_clock.hpp>

#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>

#include <mutex>

namespace tickbridge::bridge
{

world::TickId TickClock::ChangeAwaitable::await_resume() const
{
	if (m_clock.closed()) [[unlikely]] {
		throw Exception::fromError(BridgeErrc::ClockClosed, "tick clock closed while waiting for a change");
	}

	return m_clock.current();
}

TickClock::~TickClock()
{
	if (!closed()) {
		close();
	}
}

world::TickId TickClock::advance()
{
	// Publish the new value before waking, woken tasks must observe it
	uint64_t value = m_counter.fetch_add(1, std::memory_order_acq_rel) + 1;
	wakeAll();
	return world::TickId(value);
}

void TickClock::close()
{
	m_closed.store(true, std::memory_order_release);
	wakeAll();
	Log::debug("Tick clock closed at tick {}", current().value);
}

size_t TickClock::numWaiters() const noexcept
{
	std::lock_guard lock(m_waiters_lock);
	return m_waiters.size();
}

bool TickClock::changedOrClosed(world::TickId seen) const noexcept
{
	return closed() || current() != seen;
}

bool TickClock::tryRegisterWaiter(world::TickId seen, svc::detail::TaskHeader *header,
	std::coroutine_handle<> resume_point) noexcept
{
	std::lock_guard lock(m_waiters_lock);

	// `advance()` and `close()` change state before taking the lock to wake.
	// Checking under the lock guarantees we either see the change
	// or get into the list before it is swapped out.
	if (changedOrClosed(seen)) {
		return false;
	}

	m_waiters.emplace_back(svc::TaskWaker::prepareSuspend(header, resume_point));
	return true;
}

void TickClock::wakeAll()
{
	std::vector<svc::TaskWaker> to_wake;

	{
		std::lock_guard lock(m_waiters_lock);
		to_wake.swap(m_waiters);
	}

	for (const svc::TaskWaker &waker : to_wake) {
		waker.wake();
	}

	if (!to_wake.empty()) {
		Log::trace("Woke {} tick waiters", to_wake.size());
	}
}

} // namespace tickbridge::bridge
