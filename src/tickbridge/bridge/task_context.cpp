#include <tickbridge/bridge/task_context.hpp>

namespace tickbridge::bridge
{

svc::CoroSubTask<void> TaskContext::sleepUpdates(uint64_t n) const
{
	return doSleepUpdates(m_shared, n, currentTick());
}

svc::CoroSubTask<void> TaskContext::doSleepUpdates(std::shared_ptr<detail::BridgeShared> shared, uint64_t n,
	world::TickId start)
{
	TickClock &clock = shared->clock;

	world::TickId seen = clock.current();
	while (seen - start < n) {
		seen = co_await clock.waitForChange(seen);
	}
}

} // namespace tickbridge::bridge
