#pragma once

#include <tickbridge/svc/svc_fwd.hpp>
#include <tickbridge/svc/task_waker.hpp>
#include <tickbridge/visibility.hpp>

#include <coroutine>
#include <utility>

namespace tickbridge::svc
{

// Owning handle of a spawned task, move-only.
//
// Dropping the handle (destructor, `reset()` or move-assigning over it) cancels
// the task: it will not be resumed again, its coroutine frame is destroyed at
// the next scheduling point instead. Use `detach()` to let it run untracked.
// Cancellation does not retract work the task has already handed to other
// parties (e.g. queued main-thread callbacks), those still run.
//
// Another task can wait for completion without blocking its worker:
//
//   co_await handle; // Rethrows the unhandled exception, if any
//
// A task must not await its own handle, it would never be resumed.
class TICKBRIDGE_API TaskHandle {
public:
	TaskHandle() = default;
	// Assumes ownership of one reference, internal constructor
	explicit TaskHandle(detail::TaskHeader *header) noexcept : m_header(header) {}
	TaskHandle(TaskHandle &&other) noexcept : m_header(std::exchange(other.m_header, nullptr)) {}
	TaskHandle &operator=(TaskHandle &&other) noexcept;
	TaskHandle(const TaskHandle &) = delete;
	TaskHandle &operator=(const TaskHandle &) = delete;
	~TaskHandle();

	// Cancel the task and release the handle. `valid()` becomes false.
	void reset() noexcept;
	// Release the handle without cancelling. `valid()` becomes false.
	void detach() noexcept;
	// Request cancellation but keep the handle, so `wait()` can be used
	// to block until the coroutine frame is actually destroyed.
	// Has no effect if the task has already finished.
	void cancel() noexcept;

	// Check if this handle owns a valid task
	bool valid() const noexcept { return m_header != nullptr; }

	// Non-blocking check if this task has finished executing (completed or cancelled).
	// Behavior is undefined if `valid() == false`.
	bool finished() const noexcept;
	// Whether cancellation was requested for this task.
	// Behavior is undefined if `valid() == false`.
	bool cancelRequested() const noexcept;
	// Block until `finished()` becomes true.
	// Behavior is undefined if `valid() == false`.
	// Must not be called from a task coroutine, this blocks the worker thread.
	void wait() noexcept;

	// If the task finished with an unhandled exception, rethrow it.
	// Behavior is undefined if `finished() == false`.
	void rethrowIfFailed() const;

	bool await_ready() const noexcept { return finished(); }

	template<typename P>
	bool await_suspend(std::coroutine_handle<P> handle)
	{
		return addCompletionWaiter(TaskWaker::prepareSuspend(handle));
	}

	void await_resume() const { rethrowIfFailed(); }

	// Arrange `waker` to be woken when the task finishes.
	// Returns false (dropping `waker`) if it has already finished.
	bool addCompletionWaiter(TaskWaker waker) const;

private:
	detail::TaskHeader *m_header = nullptr;
};

} // namespace tickbridge::svc
