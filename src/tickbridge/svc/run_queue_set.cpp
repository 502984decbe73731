#include "run_queue_set.hpp"

#include "task_header.hpp"

#include <cassert>
#include <mutex>

namespace tickbridge::svc::detail
{

RunQueueSet::RunQueueSet(size_t num_queues)
	: m_num_queues(num_queues), m_queues(std::make_unique<Queue[]>(num_queues))
{}

RunQueueSet::~RunQueueSet()
{
	for (size_t queue = 0; queue < m_num_queues; queue++) {
		// Deref all remaining stored tasks
		while (TaskHeader *header = tryPopTask(queue)) {
			releaseTaskRef(header);
		}
	}
}

void RunQueueSet::pushTask(size_t queue, TaskHeader *header) noexcept
{
	assert(header != nullptr);
	Queue &q = m_queues[queue];

	// Counter is updated under the lock too. Otherwise a concurrent
	// `tryPopTask()` could decrement it before we increment, and that
	// would underflow into the stop bit.
	std::lock_guard lock(q.lock);
	q.items.push_back(header);

	// Only a transition from zero can have a sleeping worker
	if (q.pending.fetch_add(1, std::memory_order_release) == 0) {
		os::Futex::wakeAll(&q.pending);
	}
}

TaskHeader *RunQueueSet::tryPopTask(size_t queue) noexcept
{
	Queue &q = m_queues[queue];

	std::lock_guard lock(q.lock);
	if (q.items.empty()) {
		return nullptr;
	}

	TaskHeader *header = q.items.front();
	q.items.pop_front();
	q.pending.fetch_sub(1, std::memory_order_relaxed);
	return header;
}

TaskHeader *RunQueueSet::popTaskOrWait(size_t queue) noexcept
{
	Queue &q = m_queues[queue];

	while (true) {
		uint32_t pending = q.pending.load(std::memory_order_acquire);
		while (pending == 0) {
			os::Futex::waitInfinite(&q.pending, 0);
			pending = q.pending.load(std::memory_order_acquire);
		}

		if (pending & STOP_BIT) [[unlikely]] {
			return nullptr;
		}

		if (TaskHeader *header = tryPopTask(queue); header) [[likely]] {
			return header;
		}

		// Someone else (shutdown drain) took it, wait again
	}
}

void RunQueueSet::requestStopAll() noexcept
{
	for (size_t queue = 0; queue < m_num_queues; queue++) {
		Queue &q = m_queues[queue];
		if (q.pending.fetch_or(STOP_BIT, std::memory_order_release) == 0) {
			os::Futex::wakeAll(&q.pending);
		}
	}
}

} // namespace tickbridge::svc::detail
