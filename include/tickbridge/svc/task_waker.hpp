#pragma once

#include <tickbridge/svc/svc_fwd.hpp>
#include <tickbridge/visibility.hpp>

#include <coroutine>
#include <utility>

namespace tickbridge::svc
{

// Refcounted reference to a suspended task, used to reschedule it.
// Awaitables obtain one in `await_suspend()` via `prepareSuspend()`,
// store it next to the awaited event and call `wake()` when it happens.
//
// Waking is idempotent and coalescing: waking a task which is already
// scheduled or running only makes sure it is polled once more after
// it suspends. Waking a finished (or cancelled) task is a no-op.
class TICKBRIDGE_API TaskWaker {
public:
	TaskWaker() = default;
	TaskWaker(TaskWaker &&other) noexcept : m_header(std::exchange(other.m_header, nullptr)) {}
	TaskWaker(const TaskWaker &other) noexcept;
	TaskWaker &operator=(TaskWaker &&other) noexcept
	{
		std::swap(m_header, other.m_header);
		return *this;
	}
	TaskWaker &operator=(const TaskWaker &other) noexcept;
	~TaskWaker();

	// Reschedule the referenced task on its task service
	void wake() const noexcept;
	// Drop the reference without waking
	void reset() noexcept;

	bool valid() const noexcept { return m_header != nullptr; }

	// Must be called from `await_suspend(handle)` of an awaitable which is going to suspend.
	// Remembers `handle` as the point to resume the task from and returns a waker for it.
	// Calls `debug::bugFound()` if `handle` is not running inside a task.
	template<typename P>
	static TaskWaker prepareSuspend(std::coroutine_handle<P> handle) noexcept
	{
		return prepareSuspend(handle.promise().taskHeader(), handle);
	}

	static TaskWaker prepareSuspend(detail::TaskHeader *header, std::coroutine_handle<> resume_point) noexcept;

private:
	detail::TaskHeader *m_header = nullptr;

	// Assumes ownership of one reference
	explicit TaskWaker(detail::TaskHeader *header) noexcept : m_header(header) {}
};

} // namespace tickbridge::svc
