#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/svc/task_waker.hpp>

#include <atomic>
#include <coroutine>
#include <cstdint>
#include <exception>
#include <vector>

namespace tickbridge::svc::detail
{

// Layout of `TaskHeader::atomic_word`:
// Bits [15:0] - refcount (owning handle, wakers, run queue membership)
// Bit 16 - futex completion waiting flag (0 - no waiting, 1 - needs waking)
// Bit 17 - completion status (0 - pending, 1 - finished or cancelled)
// Bit 18 - cancellation requested
// Bit 19 - scheduled, i.e. the task sits in a run queue or is being executed
// Bit 20 - woken while scheduled, must be polled once more after it suspends
// Bits [31:21] - unused, must be zero
constexpr uint32_t TASK_REFCOUNT_MASK = (1u << 16) - 1u;
constexpr uint32_t TASK_FUTEX_WAITING_BIT = 1u << 16;
constexpr uint32_t TASK_FINISHED_BIT = 1u << 17;
constexpr uint32_t TASK_CANCEL_BIT = 1u << 18;
constexpr uint32_t TASK_SCHEDULED_BIT = 1u << 19;
constexpr uint32_t TASK_NOTIFIED_BIT = 1u << 20;

// Control block of a spawned task.
// For refcount safety access it through `TaskHandle` or `TaskWaker`.
struct TaskHeader {
	// Initially 1 - the reference of `TaskHandle` returned from `spawn()`
	std::atomic_uint32_t atomic_word = 1;
	// Root coroutine, reset when the task finishes
	CoroTask coroutine;
	// Innermost suspended coroutine of the await chain (the root one or some sub-task).
	// Written by the task itself in `TaskWaker::prepareSuspend()`, read by the worker resuming it.
	std::coroutine_handle<> resume_point;
	// Service the task was spawned on, must outlive all unfinished tasks
	TaskServiceImpl *service = nullptr;
	// Unhandled exception of the root coroutine, valid after finishing
	std::exception_ptr exception;

	// Protects `completion_waiters`, the finished flag is set before taking it
	os::FutexLock completion_lock;
	// Tasks awaiting this one through `TaskHandle`, woken once it finishes
	std::vector<TaskWaker> completion_waiters;
};

void addTaskRef(TaskHeader *header) noexcept;
// Deletes the header when the last reference is released
void releaseTaskRef(TaskHeader *header) noexcept;

// Make the task eligible for execution, see `TaskWaker::wake()` for semantics.
// Pushes it into a run queue (with a new reference) unless it is already there.
void scheduleTask(TaskHeader *header) noexcept;

} // namespace tickbridge::svc::detail
