#include <tickbridge/bridge/main_thread_queue.hpp>

#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>

#include <exception>
#include <mutex>

namespace tickbridge::bridge
{

MainThreadQueue::MainThreadQueue() noexcept : m_config() {}

MainThreadQueue::MainThreadQueue(Config cfg) noexcept : m_config(cfg) {}

MainThreadQueue::~MainThreadQueue()
{
	if (!closed()) {
		close();
	}
}

void MainThreadQueue::enqueue(MainThreadCallback callback)
{
	std::lock_guard lock(m_lock);

	// Check under the lock, `close()` must not miss a callback we add
	if (closed()) [[unlikely]] {
		throw Exception::fromError(BridgeErrc::WorldUnavailable, "main thread queue is closed");
	}

	m_callbacks.emplace_back(std::move(callback));
}

size_t MainThreadQueue::drainAll(world::World &world, world::TickId tick)
{
	const size_t limit = m_config.max_callbacks_per_tick;
	size_t executed = 0;

	MainThreadCallback callback;
	while ((limit == 0 || executed < limit) && tryPop(callback)) {
		MainThreadContext ctx(world, tick);

		try {
			callback(ctx);
		}
		catch (const std::exception &e) {
			// Its response slot is dropped below, the awaiting task gets `ResponseLost`
			Log::error("Main thread callback threw at tick {}: {}", tick.value, e.what());
		}
		catch (...) {
			Log::error("Main thread callback threw unknown exception at tick {}", tick.value);
		}

		// Destroy captured state right away, not at the next pop
		callback = MainThreadCallback();
		executed++;
	}

	if (limit != 0 && executed == limit) {
		if (size_t left = size(); left > 0) {
			Log::debug("Main thread drain limit reached at tick {}, {} callbacks left", tick.value, left);
		}
	}

	return executed;
}

void MainThreadQueue::close()
{
	std::deque<MainThreadCallback> dropped;

	{
		std::lock_guard lock(m_lock);
		m_closed.store(true, std::memory_order_release);
		dropped.swap(m_callbacks);
	}

	if (!dropped.empty()) {
		Log::debug("Main thread queue closed, dropping {} pending callbacks", dropped.size());
	}
	// Callbacks (and their response senders) are destroyed here, outside of the lock
}

size_t MainThreadQueue::size() const noexcept
{
	std::lock_guard lock(m_lock);
	return m_callbacks.size();
}

bool MainThreadQueue::tryPop(MainThreadCallback &callback)
{
	std::lock_guard lock(m_lock);
	if (m_callbacks.empty()) {
		return false;
	}

	callback = std::move(m_callbacks.front());
	m_callbacks.pop_front();
	return true;
}

} // namespace tickbridge::bridge
