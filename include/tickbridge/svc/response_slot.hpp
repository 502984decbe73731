#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/svc_fwd.hpp>
#include <tickbridge/svc/task_waker.hpp>
#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>

#include <coroutine>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace tickbridge::svc
{

namespace detail
{

template<typename T>
struct ResponseSlotState {
	enum class Status {
		Pending,
		Fulfilled,
		// Sender was destroyed without sending
		Dropped,
	};

	os::FutexLock lock;
	// All fields below are protected by `lock`
	Status status = Status::Pending;
	std::optional<T> value;
	TaskWaker waiter;
	bool receiver_alive = true;

	// Move the waker out under lock, wake after unlocking
	void settle(Status new_status, std::unique_lock<os::FutexLock> &guard) noexcept
	{
		status = new_status;
		TaskWaker to_wake = std::move(waiter);
		guard.unlock();
		to_wake.wake();
	}
};

} // namespace detail

// Single-use producer end of a response slot, move-only.
// Destroying it without calling `send()` drops the slot:
// the receiver then fails with `BridgeErrc::ResponseLost`.
template<typename T>
class ResponseSender {
public:
	ResponseSender() = default;
	explicit ResponseSender(std::shared_ptr<detail::ResponseSlotState<T>> state) noexcept : m_state(std::move(state))
	{}
	ResponseSender(ResponseSender &&) noexcept = default;
	ResponseSender(const ResponseSender &) = delete;
	ResponseSender &operator=(ResponseSender &&other) noexcept
	{
		if (this != &other) {
			drop();
			m_state = std::move(other.m_state);
		}
		return *this;
	}
	ResponseSender &operator=(const ResponseSender &) = delete;
	~ResponseSender() { drop(); }

	// Deliver the value and wake the waiting task. Can be called once.
	// Returns false if nobody is going to receive it (receiver destroyed,
	// e.g. the awaiting task was cancelled). This is not an error.
	bool send(T value)
	{
		if (!m_state) {
			return false;
		}

		auto state = std::exchange(m_state, nullptr);
		std::unique_lock guard(state->lock);

		if (!state->receiver_alive) {
			state->status = detail::ResponseSlotState<T>::Status::Fulfilled;
			return false;
		}

		state->value.emplace(std::move(value));
		state->settle(detail::ResponseSlotState<T>::Status::Fulfilled, guard);
		return true;
	}

	bool valid() const noexcept { return m_state != nullptr; }

private:
	std::shared_ptr<detail::ResponseSlotState<T>> m_state;

	void drop() noexcept
	{
		if (!m_state) {
			return;
		}

		auto state = std::exchange(m_state, nullptr);
		std::unique_lock guard(state->lock);
		state->settle(detail::ResponseSlotState<T>::Status::Dropped, guard);
	}
};

// Single-use consumer end of a response slot, move-only. Await it from a task:
//
//   T value = co_await std::move(receiver);
//
// Throws `Exception` with `BridgeErrc::ResponseLost` if the sender was dropped.
template<typename T>
class ResponseReceiver {
public:
	using Status = typename detail::ResponseSlotState<T>::Status;

	ResponseReceiver() = default;
	explicit ResponseReceiver(std::shared_ptr<detail::ResponseSlotState<T>> state) noexcept
		: m_state(std::move(state))
	{}
	ResponseReceiver(ResponseReceiver &&) noexcept = default;
	ResponseReceiver(const ResponseReceiver &) = delete;
	ResponseReceiver &operator=(ResponseReceiver &&other) noexcept
	{
		if (this != &other) {
			release();
			m_state = std::move(other.m_state);
		}
		return *this;
	}
	ResponseReceiver &operator=(const ResponseReceiver &) = delete;
	~ResponseReceiver() { release(); }

	bool await_ready() const noexcept
	{
		std::lock_guard lock(m_state->lock);
		return m_state->status != Status::Pending;
	}

	template<typename P>
	bool await_suspend(std::coroutine_handle<P> handle) noexcept
	{
		std::lock_guard lock(m_state->lock);
		if (m_state->status != Status::Pending) {
			// Settled between `await_ready` and here, don't suspend
			return false;
		}

		m_state->waiter = TaskWaker::prepareSuspend(handle);
		return true;
	}

	T await_resume()
	{
		std::lock_guard lock(m_state->lock);
		if (m_state->status != Status::Fulfilled) {
			throw Exception::fromError(BridgeErrc::ResponseLost, "response slot dropped without a value");
		}

		return std::move(*m_state->value);
	}

	bool valid() const noexcept { return m_state != nullptr; }

private:
	std::shared_ptr<detail::ResponseSlotState<T>> m_state;

	void release() noexcept
	{
		if (m_state) {
			std::lock_guard lock(m_state->lock);
			m_state->receiver_alive = false;
			m_state->waiter.reset();
		}
		m_state.reset();
	}
};

// Create a single-use response slot
template<typename T>
std::pair<ResponseSender<T>, ResponseReceiver<T>> makeResponseSlot()
{
	auto state = std::make_shared<detail::ResponseSlotState<T>>();
	return { ResponseSender<T>(state), ResponseReceiver<T>(state) };
}

} // namespace tickbridge::svc
