#pragma once

#include <tickbridge/bridge/bridge_fwd.hpp>
#include <tickbridge/bridge/channel_event_bridge.hpp>
#include <tickbridge/bridge/main_thread_queue.hpp>
#include <tickbridge/bridge/task_context.hpp>
#include <tickbridge/bridge/tick_clock.hpp>
#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/channel.hpp>
#include <tickbridge/svc/task_handle.hpp>
#include <tickbridge/svc/task_service.hpp>
#include <tickbridge/visibility.hpp>
#include <tickbridge/world/tick_id.hpp>
#include <tickbridge/world/world.hpp>

#include <functional>
#include <memory>
#include <type_traits>
#include <typeinfo>
#include <vector>

namespace tickbridge::bridge
{

namespace detail
{

// Marker resource, present in the world while a bridge is attached to it
struct AttachedBridge {
	BridgeHandle *handle;
};

// Marker resource, inserted when a channel of events `T` is bridged into the world.
// Stays for the lifetime of the world, detaching the bridge does not free the type.
template<typename T>
struct BridgedEventType {};

} // namespace detail

// Connects a world to the task runtime. Owned and used by the world thread.
//
// At most one bridge can be attached to a world. Every tick the host loop
// calls `tickPump()`, which advances the tick clock, rotates event buffers,
// drains every registered event channel and finally runs queued main-thread
// callbacks.
//
// Destroying the bridge closes the clock and the main thread queue (waking
// sleeping tasks with `ClockClosed`, waiting ones with `ResponseLost`) and then
// destroys the owned task service, if any.
class TICKBRIDGE_API BridgeHandle {
public:
	struct Config {
		// Used only when the bridge creates its own task service
		svc::TaskService::Config task_service;
		MainThreadQueue::Config main_thread_queue;
		// Initial tick clock value, e.g. of a world restored from a save
		world::TickId start_tick;
	};

	// Attach to `world` with a newly created task service.
	// Throws `Exception` with `BridgeErrc::DuplicateBridge` if `world` already has a bridge.
	BridgeHandle(world::World &world, Config cfg);
	// Attach to `world` using an externally owned task service, it must outlive the bridge.
	// Tasks spawned through this bridge may keep running after it is destroyed.
	BridgeHandle(world::World &world, svc::TaskService &task_service, Config cfg);
	BridgeHandle(BridgeHandle &&) = delete;
	BridgeHandle(const BridgeHandle &) = delete;
	BridgeHandle &operator=(BridgeHandle &&) = delete;
	BridgeHandle &operator=(const BridgeHandle &) = delete;
	~BridgeHandle();

	// Create a task with `factory(TaskContext)` and schedule it right away.
	// The factory returns either `svc::CoroTask` (the result is `svc::TaskHandle`)
	// or `svc::CoroSubTask<T>` (the result is `svc::JoinHandle<T>` delivering its value).
	// Dropping the returned handle cancels the task, use `detach()` to keep it running.
	template<typename F>
		requires std::is_invocable_v<F, TaskContext>
	[[nodiscard]] auto spawnBackgroundTask(F &&factory)
	{
		return m_task_service.spawn(std::invoke(std::forward<F>(factory), taskContext()));
	}

	// Bridge values received from `receiver` into `world.events<T>()`,
	// creating the event store if needed. Returns `*this` for chaining.
	// Throws `Exception` with `BridgeErrc::DuplicateBridge` if `T` was ever bridged
	// into this world, by this or by an earlier attached bridge.
	template<typename T>
	BridgeHandle &addEventChannel(svc::Receiver<T> receiver)
	{
		if (m_world.hasResource<detail::BridgedEventType<T>>()) [[unlikely]] {
			throwAlreadyBridged(typeid(T));
		}

		m_world.initEvents<T>();
		addBridge(std::make_unique<ChannelEventBridge<T>>(std::move(receiver)));
		m_world.insertResource<detail::BridgedEventType<T>>();
		return *this;
	}

	// Run one world update: advance the clock, rotate event buffers, drain event
	// channels (in registration order), run main-thread callbacks. Returns the new tick.
	// World thread only, calling it re-entrantly or concurrently is a fatal bug.
	world::TickId tickPump();

	world::TickId currentTick() const noexcept { return m_shared->clock.current(); }
	TaskContext taskContext() const noexcept { return TaskContext(m_shared); }

	world::World &world() noexcept { return m_world; }
	svc::TaskService &taskService() noexcept { return m_task_service; }
	TickClock &tickClock() noexcept { return m_shared->clock; }
	MainThreadQueue &mainThreadQueue() noexcept { return m_shared->queue; }
	size_t numEventChannels() const noexcept { return m_bridges.size(); }

private:
	// Declared first to be destroyed last, after everything using it
	std::unique_ptr<svc::TaskService> m_owned_task_service;
	svc::TaskService &m_task_service;
	world::World &m_world;
	std::shared_ptr<detail::BridgeShared> m_shared;

	os::FutexLock m_pump_guard;
	std::vector<std::unique_ptr<detail::IChannelEventBridge>> m_bridges;

	// Exactly one of `owned` and `external` is non-null
	BridgeHandle(world::World &world, std::unique_ptr<svc::TaskService> owned, svc::TaskService *external,
		Config cfg);

	[[noreturn]] static void throwAlreadyBridged(const std::type_info &type);
	void addBridge(std::unique_ptr<detail::IChannelEventBridge> bridge);
};

} // namespace tickbridge::bridge
