#pragma once

#include <tickbridge/svc/svc_fwd.hpp>
#include <tickbridge/visibility.hpp>

#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

namespace tickbridge::svc
{

// Handle to a created task coroutine with `std::unique_ptr`-like semantics.
// To convert an arbitrary function/lambda into a task coroutine, make this type
// its return type and use at least one `co_await/co_return` in its body.
//
// The coroutine does not start executing on creation (initial suspend),
// pass the returned object to `TaskService::spawn()` to schedule it.
//
// NOTE: do not manually manipulate raw coroutine handles (resume/destroy/etc.),
// this will break the wakeup logic and cause various kinds of UB.
class CoroTask final {
public:
	using RawHandle = std::coroutine_handle<detail::CoroTaskState>;

	CoroTask() = default;
	explicit CoroTask(RawHandle handle) noexcept : m_handle(handle) {}
	CoroTask(CoroTask &&other) noexcept : m_handle(std::exchange(other.m_handle, {})) {}

	CoroTask &operator=(CoroTask &&other) noexcept
	{
		std::swap(m_handle, other.m_handle);
		return *this;
	}

	CoroTask(const CoroTask &) = delete;
	CoroTask &operator=(const CoroTask &) = delete;

	~CoroTask() { reset(); }

	// Destroy the coroutine frame (if any), running destructors of its locals
	void reset() noexcept
	{
		if (m_handle) {
			std::exchange(m_handle, {}).destroy();
		}
	}

	bool valid() const noexcept { return static_cast<bool>(m_handle); }
	bool done() const noexcept { return m_handle.done(); }

	// Get raw handle, intended to be used only by implementation
	RawHandle get() const noexcept { return m_handle; }

private:
	RawHandle m_handle;
};

namespace detail
{

// Base class for "promise" objects of task and sub-task coroutines.
// Purely an implementation detail exposed because of C++ coroutine requirements.
//
// Every promise knows the task it is (transitively) awaited by. Awaitables
// use it to get a `TaskWaker` when suspending, see `TaskWaker::prepareSuspend()`.
class TICKBRIDGE_API CoroPromiseBase {
public:
	CoroPromiseBase() = default;
	CoroPromiseBase(CoroPromiseBase &&) = delete;
	CoroPromiseBase(const CoroPromiseBase &) = delete;
	CoroPromiseBase &operator=(CoroPromiseBase &&) = delete;
	CoroPromiseBase &operator=(const CoroPromiseBase &) = delete;
	~CoroPromiseBase() = default;

	void unhandled_exception() noexcept { m_unhandled_exception = std::current_exception(); }

	void rethrowIfHasException();
	std::exception_ptr takeException() noexcept { return std::exchange(m_unhandled_exception, {}); }

	TaskHeader *taskHeader() const noexcept { return m_task_header; }
	void setTaskHeader(TaskHeader *header) noexcept { m_task_header = header; }

protected:
	TaskHeader *m_task_header = nullptr;
	std::exception_ptr m_unhandled_exception;
};

// "Promise" object of `CoroTask`. Lazily-started with no return value.
// Final suspend is "always" so the task service can observe `done()`
// and destroy the frame itself.
class TICKBRIDGE_API CoroTaskState final : public CoroPromiseBase {
public:
	CoroTask get_return_object() noexcept { return CoroTask(CoroTask::RawHandle::from_promise(*this)); }

	constexpr std::suspend_always initial_suspend() const noexcept { return {}; }
	constexpr std::suspend_always final_suspend() const noexcept { return {}; }
	constexpr void return_void() const noexcept {}
};

// Base non-templated part of `CoroSubTaskState<T>`.
// Lazily-started; when done, transfers control back to the awaiting coroutine.
class TICKBRIDGE_API CoroSubTaskStateBase : public CoroPromiseBase {
public:
	struct FinalAwaiter {
		constexpr bool await_ready() const noexcept { return false; }

		template<typename P>
		std::coroutine_handle<> await_suspend(std::coroutine_handle<P> handle) noexcept
		{
			auto &state = static_cast<CoroSubTaskStateBase &>(handle.promise());
			std::coroutine_handle<> continuation = state.m_continuation;
			return continuation ? continuation : std::noop_coroutine();
		}

		constexpr void await_resume() const noexcept {}
	};

	constexpr std::suspend_always initial_suspend() const noexcept { return {}; }
	FinalAwaiter final_suspend() const noexcept { return {}; }

	// Bind this sub-task to the coroutine awaiting it.
	// `awaiter` must belong to a task, i.e. have a non-null task header.
	void attach(std::coroutine_handle<> awaiter, TaskHeader *header) noexcept
	{
		m_continuation = awaiter;
		m_task_header = header;
	}

protected:
	std::coroutine_handle<> m_continuation;
};

// "Promise" object of `CoroSubTask<T>`
template<typename T>
class CoroSubTaskState final : public CoroSubTaskStateBase {
public:
	CoroSubTask<T> get_return_object() noexcept;

	template<std::convertible_to<T> From>
	void return_value(From &&value) noexcept(std::is_nothrow_constructible_v<T, From>)
	{
		m_object.emplace(std::forward<From>(value));
	}

	// Can be called only once in implementation of `await_resume`
	T takeObject() { return std::move(*m_object); }

private:
	std::optional<T> m_object;
};

// Specialization of `CoroSubTaskState` for `void` return type
template<>
class CoroSubTaskState<void> final : public CoroSubTaskStateBase {
public:
	CoroSubTask<void> get_return_object() noexcept;

	constexpr void return_void() const noexcept {}
};

} // namespace detail

// Handle to a created sub-task coroutine with `std::unique_ptr`-like semantics.
// Sub-tasks are asynchronous operations callable from tasks (and other sub-tasks):
//
//   CoroSubTask<int> computeSomething(TaskContext ctx)
//   {
//     co_await ctx.sleepUpdates(2);
//     co_return 42;
//   }
//
//   CoroTask myTask(TaskContext ctx)
//   {
//     // Blocks the task until the sub-task completes.
//     // Will either return an object or rethrow an exception.
//     int value = co_await computeSomething(ctx);
//   }
//
// The body starts executing only when awaited. Awaiting it anywhere
// outside of a task coroutine is a bug (caught with `debug::bugFound`
// as soon as the sub-task tries to suspend).
template<typename T>
class CoroSubTask final {
public:
	using RawHandle = std::coroutine_handle<detail::CoroSubTaskState<T>>;

	explicit CoroSubTask(RawHandle handle) noexcept : m_handle(handle) {}
	CoroSubTask(CoroSubTask &&other) noexcept : m_handle(std::exchange(other.m_handle, {})) {}

	CoroSubTask &operator=(CoroSubTask &&other) noexcept
	{
		std::swap(m_handle, other.m_handle);
		return *this;
	}

	CoroSubTask(const CoroSubTask &) = delete;
	CoroSubTask &operator=(const CoroSubTask &) = delete;

	~CoroSubTask()
	{
		if (m_handle) {
			m_handle.destroy();
		}
	}

	bool await_ready() const noexcept { return m_handle.done(); }

	// Start (symmetric transfer into) the sub-task
	template<typename P>
	std::coroutine_handle<> await_suspend(std::coroutine_handle<P> awaiter) noexcept
	{
		m_handle.promise().attach(awaiter, awaiter.promise().taskHeader());
		return m_handle;
	}

	T await_resume()
	{
		auto &state = m_handle.promise();
		state.rethrowIfHasException();

		if constexpr (!std::is_void_v<T>) {
			return state.takeObject();
		}
	}

private:
	RawHandle m_handle;
};

template<typename T>
CoroSubTask<T> detail::CoroSubTaskState<T>::get_return_object() noexcept
{
	return CoroSubTask<T>(CoroSubTask<T>::RawHandle::from_promise(*this));
}

inline CoroSubTask<void> detail::CoroSubTaskState<void>::get_return_object() noexcept
{
	return CoroSubTask<void>(CoroSubTask<void>::RawHandle::from_promise(*this));
}

} // namespace tickbridge::svc

namespace std
{

template<typename... Args>
struct coroutine_traits<tickbridge::svc::CoroTask, Args...> {
	using promise_type = tickbridge::svc::detail::CoroTaskState;
};

template<typename T, typename... Args>
struct coroutine_traits<tickbridge::svc::CoroSubTask<T>, Args...> {
	using promise_type = tickbridge::svc::detail::CoroSubTaskState<T>;
};

} // namespace std
