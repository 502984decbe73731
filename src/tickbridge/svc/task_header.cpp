#include "task_header.hpp"

#include "task_service_impl.hpp"

namespace tickbridge::svc::detail
{

void addTaskRef(TaskHeader *header) noexcept
{
	header->atomic_word.fetch_add(1, std::memory_order_relaxed);
}

void releaseTaskRef(TaskHeader *header) noexcept
{
	if ((header->atomic_word.fetch_sub(1, std::memory_order_acq_rel) & TASK_REFCOUNT_MASK) > 1) {
		// This was not the last ref
		return;
	}

	delete header;
}

void scheduleTask(TaskHeader *header) noexcept
{
	uint32_t word = header->atomic_word.load(std::memory_order_relaxed);
	uint32_t desired;

	do {
		if (word & TASK_FINISHED_BIT) {
			// Nothing to wake anymore
			return;
		}

		if (word & TASK_SCHEDULED_BIT) {
			// Already queued or running, the worker will poll it once more
			desired = word | TASK_NOTIFIED_BIT;
		} else {
			// Take it out of idle state, adding a reference for the run queue
			desired = (word | TASK_SCHEDULED_BIT) + 1u;
		}
	} while (!header->atomic_word.compare_exchange_weak(word, desired, std::memory_order_acq_rel,
		std::memory_order_relaxed));

	if (!(word & TASK_SCHEDULED_BIT)) {
		header->service->pushTask(header);
	}
}

} // namespace tickbridge::svc::detail
