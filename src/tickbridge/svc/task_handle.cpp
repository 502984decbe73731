#include <tickbridge/svc/task_handle.hpp>

#include <tickbridge/os/futex.hpp>

#include "task_header.hpp"

#include <cassert>
#include <mutex>

namespace tickbridge::svc
{

using namespace detail;

TaskHandle &TaskHandle::operator=(TaskHandle &&other) noexcept
{
	if (this != &other) {
		reset();
		m_header = std::exchange(other.m_header, nullptr);
	}

	return *this;
}

TaskHandle::~TaskHandle()
{
	reset();
}

void TaskHandle::reset() noexcept
{
	if (!m_header) {
		return;
	}

	cancel();
	releaseTaskRef(std::exchange(m_header, nullptr));
}

void TaskHandle::detach() noexcept
{
	if (m_header) {
		releaseTaskRef(std::exchange(m_header, nullptr));
	}
}

void TaskHandle::cancel() noexcept
{
	assert(m_header);

	uint32_t word = m_header->atomic_word.fetch_or(TASK_CANCEL_BIT, std::memory_order_acq_rel);
	if (!(word & TASK_FINISHED_BIT)) {
		// Get it polled so the worker notices the flag and destroys the frame
		scheduleTask(m_header);
	}
}

bool TaskHandle::finished() const noexcept
{
	assert(m_header);
	return !!(m_header->atomic_word.load(std::memory_order_acquire) & TASK_FINISHED_BIT);
}

bool TaskHandle::cancelRequested() const noexcept
{
	assert(m_header);
	return !!(m_header->atomic_word.load(std::memory_order_acquire) & TASK_CANCEL_BIT);
}

void TaskHandle::wait() noexcept
{
	assert(m_header);

	uint32_t word = m_header->atomic_word.load(std::memory_order_acquire);
	if (word & TASK_FINISHED_BIT) {
		return;
	}

	// Set futex waiting flag. We don't need to care about resetting it,
	// it will be taken into consideration just once when finishing.
	word = m_header->atomic_word.fetch_or(TASK_FUTEX_WAITING_BIT, std::memory_order_acq_rel)
		| TASK_FUTEX_WAITING_BIT;

	while (!(word & TASK_FINISHED_BIT)) {
		// The word also changes on refcount/scheduling updates,
		// those just cause another loop iteration
		os::Futex::waitInfinite(&m_header->atomic_word, word);
		word = m_header->atomic_word.load(std::memory_order_acquire);
	}
}

void TaskHandle::rethrowIfFailed() const
{
	assert(m_header);

	if (m_header->exception) {
		std::rethrow_exception(m_header->exception);
	}
}

bool TaskHandle::addCompletionWaiter(TaskWaker waker) const
{
	assert(m_header);

	// `finishTask()` sets the flag before taking the lock to collect waiters,
	// so checking it under the lock can't miss the wakeup
	std::lock_guard lock(m_header->completion_lock);
	if (m_header->atomic_word.load(std::memory_order_acquire) & TASK_FINISHED_BIT) {
		return false;
	}

	m_header->completion_waiters.emplace_back(std::move(waker));
	return true;
}

} // namespace tickbridge::svc
