#pragma once

#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/svc/task_handle.hpp>
#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>

#include <coroutine>
#include <memory>
#include <optional>
#include <type_traits>
#include <utility>
#include <variant>

namespace tickbridge::svc
{

namespace detail
{

// Value produced by a task spawned from `CoroSubTask<T>`.
// Written by the task before it finishes, read only after `TaskHandle::finished()`.
template<typename T>
using JoinResult = std::optional<std::conditional_t<std::is_void_v<T>, std::monostate, T>>;

// Root task running `body` to completion and storing its value
template<typename T>
CoroTask storeTaskResult(CoroSubTask<T> body, std::shared_ptr<JoinResult<T>> result)
{
	if constexpr (std::is_void_v<T>) {
		co_await body;
		result->emplace();
	} else {
		result->emplace(co_await body);
	}
}

} // namespace detail

// Owning handle of a spawned task producing a value of type `T`, move-only.
// Same cancellation rules as `TaskHandle`, which it wraps.
//
// From another task, await it to get the value:
//
//   JoinHandle<int> job = service.spawn(computeSomething());
//   int value = co_await job;
//
// Outside of tasks use `wait()` and then `takeResult()`.
template<typename T>
class JoinHandle {
public:
	JoinHandle() = default;
	JoinHandle(TaskHandle task, std::shared_ptr<detail::JoinResult<T>> result) noexcept
		: m_task(std::move(task)), m_result(std::move(result))
	{}
	JoinHandle(JoinHandle &&) noexcept = default;
	JoinHandle(const JoinHandle &) = delete;
	JoinHandle &operator=(JoinHandle &&) noexcept = default;
	JoinHandle &operator=(const JoinHandle &) = delete;
	~JoinHandle() = default;

	bool valid() const noexcept { return m_task.valid(); }
	bool finished() const noexcept { return m_task.finished(); }

	void cancel() noexcept { m_task.cancel(); }
	void detach() noexcept { m_task.detach(); }
	// Blocks the calling thread, must not be called from a task coroutine
	void wait() noexcept { m_task.wait(); }

	// Get the produced value. Behavior is undefined if `finished() == false`.
	// Rethrows the unhandled exception of the task, if any. Throws `Exception`
	// with `BridgeErrc::TaskCancelled` if the task was cancelled before producing
	// the value, or if the value was already taken.
	T takeResult()
	{
		m_task.rethrowIfFailed();

		if (!m_result->has_value()) {
			throw Exception::fromError(BridgeErrc::TaskCancelled, "task finished without a result");
		}

		if constexpr (std::is_void_v<T>) {
			m_result->reset();
		} else {
			T value = std::move(**m_result);
			m_result->reset();
			return value;
		}
	}

	// Underlying untyped handle
	TaskHandle &task() noexcept { return m_task; }

	bool await_ready() const noexcept { return m_task.await_ready(); }

	template<typename P>
	bool await_suspend(std::coroutine_handle<P> handle)
	{
		return m_task.await_suspend(handle);
	}

	T await_resume() { return takeResult(); }

private:
	TaskHandle m_task;
	std::shared_ptr<detail::JoinResult<T>> m_result;
};

} // namespace tickbridge::svc
