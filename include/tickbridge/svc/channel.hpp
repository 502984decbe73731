#pragma once

#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/svc_fwd.hpp>

#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>

namespace tickbridge::svc
{

namespace detail
{

template<typename T>
struct ChannelState {
	os::FutexLock lock;
	std::deque<T> items;
	// Both fields are protected by `lock`
	size_t num_senders = 1;
	bool receiver_alive = true;
};

} // namespace detail

// Producer end of an unbounded multi-producer single-consumer channel.
// Copy it to get more producers; any thread can send.
template<typename T>
class Sender {
public:
	Sender() = default;
	explicit Sender(std::shared_ptr<detail::ChannelState<T>> state) noexcept : m_state(std::move(state)) {}
	Sender(Sender &&) noexcept = default;
	Sender(const Sender &other) : m_state(other.m_state) { addSender(); }
	Sender &operator=(Sender &&other) noexcept
	{
		if (this != &other) {
			release();
			m_state = std::move(other.m_state);
		}
		return *this;
	}
	Sender &operator=(const Sender &other)
	{
		if (this != &other) {
			release();
			m_state = other.m_state;
			addSender();
		}
		return *this;
	}
	~Sender() { release(); }

	// Never blocks. Returns false (dropping `value`) if the receiver is gone.
	bool send(T value)
	{
		if (!m_state) {
			return false;
		}

		std::lock_guard lock(m_state->lock);
		if (!m_state->receiver_alive) {
			return false;
		}

		m_state->items.emplace_back(std::move(value));
		return true;
	}

	// Whether the receiver end was destroyed
	bool closed() const
	{
		if (!m_state) {
			return true;
		}

		std::lock_guard lock(m_state->lock);
		return !m_state->receiver_alive;
	}

	bool valid() const noexcept { return m_state != nullptr; }

private:
	std::shared_ptr<detail::ChannelState<T>> m_state;

	void addSender()
	{
		if (m_state) {
			std::lock_guard lock(m_state->lock);
			m_state->num_senders++;
		}
	}

	void release() noexcept
	{
		if (m_state) {
			std::lock_guard lock(m_state->lock);
			m_state->num_senders--;
		}
		m_state.reset();
	}
};

// Consumer end of the channel, move-only. Receiving never blocks,
// it is meant to be polled (e.g. once per tick by a `ChannelEventBridge`).
template<typename T>
class Receiver {
public:
	Receiver() = default;
	explicit Receiver(std::shared_ptr<detail::ChannelState<T>> state) noexcept : m_state(std::move(state)) {}
	Receiver(Receiver &&) noexcept = default;
	Receiver(const Receiver &) = delete;
	Receiver &operator=(Receiver &&other) noexcept
	{
		if (this != &other) {
			release();
			m_state = std::move(other.m_state);
		}
		return *this;
	}
	Receiver &operator=(const Receiver &) = delete;
	~Receiver() { release(); }

	// Take the oldest value, or return nothing if the channel is
	// empty right now. Use `closed()` to tell "empty" from "empty forever".
	std::optional<T> tryReceive()
	{
		if (!m_state) {
			return std::nullopt;
		}

		std::lock_guard lock(m_state->lock);
		if (m_state->items.empty()) {
			return std::nullopt;
		}

		std::optional<T> value(std::move(m_state->items.front()));
		m_state->items.pop_front();
		return value;
	}

	// True once all senders are gone and every sent value was received
	bool closed() const
	{
		if (!m_state) {
			return true;
		}

		std::lock_guard lock(m_state->lock);
		return m_state->num_senders == 0 && m_state->items.empty();
	}

	// Number of values waiting to be received
	size_t size() const
	{
		if (!m_state) {
			return 0;
		}

		std::lock_guard lock(m_state->lock);
		return m_state->items.size();
	}

	bool valid() const noexcept { return m_state != nullptr; }

private:
	std::shared_ptr<detail::ChannelState<T>> m_state;

	void release() noexcept
	{
		if (m_state) {
			std::lock_guard lock(m_state->lock);
			m_state->receiver_alive = false;
			// Undelivered values die with the channel
			m_state->items.clear();
		}
		m_state.reset();
	}
};

// Create an unbounded MPSC channel
template<typename T>
std::pair<Sender<T>, Receiver<T>> makeChannel()
{
	auto state = std::make_shared<detail::ChannelState<T>>();
	return { Sender<T>(state), Receiver<T>(state) };
}

} // namespace tickbridge::svc
