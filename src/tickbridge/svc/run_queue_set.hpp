#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/svc_fwd.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>

namespace tickbridge::svc::detail
{

// Set of per-worker FIFO queues of runnable tasks.
// Every stored pointer carries one task reference owned by the queue,
// popping transfers it to the caller.
class RunQueueSet {
public:
	explicit RunQueueSet(size_t num_queues);
	RunQueueSet(RunQueueSet &&) = delete;
	RunQueueSet(const RunQueueSet &) = delete;
	RunQueueSet &operator=(RunQueueSet &&) = delete;
	RunQueueSet &operator=(const RunQueueSet &) = delete;
	~RunQueueSet();

	size_t numQueues() const noexcept { return m_num_queues; }

	void pushTask(size_t queue, TaskHeader *header) noexcept;

	// Returns null if the queue is empty. Ignores the stop flag.
	TaskHeader *tryPopTask(size_t queue) noexcept;
	// Sleeps until a task arrives. Returns null when the stop flag is raised.
	TaskHeader *popTaskOrWait(size_t queue) noexcept;

	void requestStopAll() noexcept;

private:
	constexpr static size_t CACHE_LINE = 64;

	// Layout of `Queue::pending`:
	// Bits [30:0] - number of items, mirrors `items.size()`
	// Bit 31 - stop requested, the worker should exit
	constexpr static uint32_t STOP_BIT = 1u << 31;

	struct alignas(CACHE_LINE) Queue {
		os::FutexLock lock;
		std::deque<TaskHeader *> items;
		// Modified under `lock` together with `items`, read and
		// waited on (futex) without it by the owning worker
		std::atomic_uint32_t pending = 0;
	};

	const size_t m_num_queues;
	std::unique_ptr<Queue[]> m_queues;
};

} // namespace tickbridge::svc::detail
