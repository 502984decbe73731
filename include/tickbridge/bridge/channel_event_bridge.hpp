#pragma once

#include <tickbridge/bridge/bridge_fwd.hpp>
#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/channel.hpp>
#include <tickbridge/visibility.hpp>
#include <tickbridge/world/world.hpp>

#include <cstddef>
#include <mutex>
#include <typeinfo>
#include <utility>

namespace tickbridge::bridge
{

namespace detail
{

// Type-erased drain step stored by `BridgeHandle`
class IChannelEventBridge {
public:
	IChannelEventBridge() = default;
	IChannelEventBridge(IChannelEventBridge &&) = delete;
	IChannelEventBridge(const IChannelEventBridge &) = delete;
	IChannelEventBridge &operator=(IChannelEventBridge &&) = delete;
	IChannelEventBridge &operator=(const IChannelEventBridge &) = delete;
	virtual ~IChannelEventBridge() = default;

	// Returns the number of published events
	virtual size_t drainStep(world::World &world) = 0;
	virtual const std::type_info &eventType() const noexcept = 0;
};

// Calls `debug::bugFound()`, does not return
[[noreturn]] TICKBRIDGE_API void reportConcurrentDrain(const std::type_info &event_type);

} // namespace detail

// Moves values of type `T` from a channel into the world's `Events<T>`.
// At most one bridge per event type exists per world, register it with
// `BridgeHandle::addEventChannel<T>()` instead of constructing directly.
template<typename T>
class ChannelEventBridge final : public detail::IChannelEventBridge {
public:
	explicit ChannelEventBridge(svc::Receiver<T> receiver) noexcept : m_receiver(std::move(receiver)) {}
	~ChannelEventBridge() override = default;

	// Publish every value currently in the channel, in receive order.
	// Stops when the channel is empty, never blocks. Must be called
	// only by the pump thread, concurrent calls are a fatal bug.
	size_t drainStep(world::World &world) override
	{
		std::unique_lock guard(m_drain_guard, std::try_to_lock);
		if (!guard.owns_lock()) [[unlikely]] {
			detail::reportConcurrentDrain(typeid(T));
		}

		world::Events<T> &events = world.events<T>();

		size_t published = 0;
		while (auto value = m_receiver.tryReceive()) {
			events.send(std::move(*value));
			published++;
		}

		return published;
	}

	const std::type_info &eventType() const noexcept override { return typeid(T); }

	// Whether all senders are gone and nothing is left to drain
	bool channelClosed() const { return m_receiver.closed(); }

private:
	os::FutexLock m_drain_guard;
	svc::Receiver<T> m_receiver;
};

} // namespace tickbridge::bridge
