#include "task_worker.hpp"

#include <tickbridge/debug/thread_name.hpp>
#include <tickbridge/os/futex.hpp>
#include <tickbridge/util/log.hpp>

#include "run_queue_set.hpp"
#include "task_header.hpp"
#include "task_service_impl.hpp"

#include <mutex>
#include <vector>

namespace tickbridge::svc::detail
{

namespace
{

void logUnhandledException(const std::exception_ptr &ptr) noexcept
{
	// The exception stays stored in the header for `TaskHandle::rethrowIfFailed()`,
	// but nobody might ever call it - detached tasks especially
	try {
		std::rethrow_exception(ptr);
	}
	catch (const std::exception &e) {
		Log::error("Task finished with unhandled exception: {}", e.what());
	}
	catch (...) {
		Log::error("Task finished with unhandled exception of non-standard type");
	}
}

// Destroy the frame, signal completion and drop the run queue reference
void finishTask(TaskServiceImpl &service, TaskHeader *header) noexcept
{
	// Destructors of coroutine locals can wake or spawn other tasks, that's fine.
	// Frame must be gone before anyone observes the finished flag.
	header->coroutine.reset();

	uint32_t word = header->atomic_word.fetch_or(TASK_FINISHED_BIT, std::memory_order_acq_rel);
	service.onTaskFinished(header);

	std::vector<TaskWaker> waiters;
	{
		std::lock_guard lock(header->completion_lock);
		waiters.swap(header->completion_waiters);
	}

	for (const TaskWaker &waiter : waiters) {
		waiter.wake();
	}

	if (word & TASK_FUTEX_WAITING_BIT) [[unlikely]] {
		// Someone is blocked in `TaskHandle::wait()`. We still hold
		// the run queue reference so the address is valid here.
		os::Futex::wakeAll(&header->atomic_word);
	}

	releaseTaskRef(header);
}

// Task suspended - either go idle or requeue if it was woken in the meantime
void suspendTask(TaskServiceImpl &service, TaskHeader *header) noexcept
{
	uint32_t word = header->atomic_word.load(std::memory_order_relaxed);
	uint32_t desired;

	do {
		if (word & TASK_NOTIFIED_BIT) {
			desired = word & ~TASK_NOTIFIED_BIT;
		} else {
			desired = word & ~TASK_SCHEDULED_BIT;
		}
	} while (!header->atomic_word.compare_exchange_weak(word, desired, std::memory_order_acq_rel,
		std::memory_order_relaxed));

	if (word & TASK_NOTIFIED_BIT) {
		// Queue reference is passed along
		service.pushTask(header);
	} else {
		// Whoever wakes it next will add a new one
		releaseTaskRef(header);
	}
}

} // namespace

void TaskWorker::threadFn(TaskServiceImpl &service, RunQueueSet &queue_set, size_t my_queue)
{
	debug::setThreadName("TaskWorker@%zu", my_queue);

	// When the queue returns null it means a stop flag was raised
	while (TaskHeader *header = queue_set.popTaskOrWait(my_queue)) {
		runTask(service, header);
	}
}

void TaskWorker::runTask(TaskServiceImpl &service, TaskHeader *header) noexcept
{
	// Clear the notification flag before resuming - wakeups
	// arriving from now on require yet another poll
	uint32_t word = header->atomic_word.fetch_and(~TASK_NOTIFIED_BIT, std::memory_order_acq_rel);

	if (word & TASK_CANCEL_BIT) [[unlikely]] {
		Log::trace("Destroying cancelled task {}", static_cast<void *>(header));
		finishTask(service, header);
		return;
	}

	header->resume_point.resume();

	if (!header->coroutine.done()) {
		suspendTask(service, header);
		return;
	}

	if (auto exception = header->coroutine.get().promise().takeException(); exception) [[unlikely]] {
		logUnhandledException(exception);
		header->exception = std::move(exception);
	}

	finishTask(service, header);
}

} // namespace tickbridge::svc::detail
