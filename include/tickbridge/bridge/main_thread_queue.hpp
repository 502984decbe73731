#pragma once

#include <tickbridge/bridge/bridge_fwd.hpp>
#include <tickbridge/os/futex.hpp>
#include <tickbridge/svc/unique_function.hpp>
#include <tickbridge/visibility.hpp>
#include <tickbridge/world/tick_id.hpp>

#include <atomic>
#include <cstddef>
#include <deque>

namespace tickbridge::world
{

class World;

} // namespace tickbridge::world

namespace tickbridge::bridge
{

// Exclusive access to the world granted to a main-thread callback.
// Valid only during the callback invocation, never store it.
struct MainThreadContext {
	MainThreadContext(world::World &w, world::TickId tick) noexcept : world(w), current_tick(tick) {}
	MainThreadContext(MainThreadContext &&) = delete;
	MainThreadContext(const MainThreadContext &) = delete;
	MainThreadContext &operator=(MainThreadContext &&) = delete;
	MainThreadContext &operator=(const MainThreadContext &) = delete;
	~MainThreadContext() = default;

	world::World &world;
	world::TickId current_tick;
};

using MainThreadCallback = svc::UniqueFunction<void(MainThreadContext &)>;

// Many-producer single-consumer FIFO of callbacks executed on the world thread.
// `enqueue()` is callable from any thread, `drainAll()` only by the pump.
class TICKBRIDGE_API MainThreadQueue {
public:
	struct Config {
		// Maximal number of callbacks executed by one `drainAll()` call, 0 = unbounded.
		// Unbounded drain lets a flood of enqueues from tasks delay the next tick
		// arbitrarily. With a limit the excess stays queued for the next tick.
		size_t max_callbacks_per_tick = 0;
	};

	MainThreadQueue() noexcept;
	explicit MainThreadQueue(Config cfg) noexcept;
	MainThreadQueue(MainThreadQueue &&) = delete;
	MainThreadQueue(const MainThreadQueue &) = delete;
	MainThreadQueue &operator=(MainThreadQueue &&) = delete;
	MainThreadQueue &operator=(const MainThreadQueue &) = delete;
	~MainThreadQueue();

	// Never blocks. Throws `Exception` with `BridgeErrc::WorldUnavailable` if closed.
	void enqueue(MainThreadCallback callback);

	// Execute queued callbacks in FIFO order, returns how many were executed.
	// Callbacks enqueued during the drain (including by callbacks themselves)
	// are executed in the same drain unless the per-tick limit is reached.
	// An exception escaping a callback is logged, the drain continues.
	size_t drainAll(world::World &world, world::TickId tick);

	// Reject further enqueues and destroy pending callbacks,
	// tasks awaiting their results get `BridgeErrc::ResponseLost`
	void close();
	bool closed() const noexcept { return m_closed.load(std::memory_order_acquire); }

	// Number of pending callbacks, outdated as soon as it is returned
	size_t size() const noexcept;

	const Config &config() const noexcept { return m_config; }

private:
	const Config m_config;
	std::atomic_bool m_closed = false;

	mutable os::FutexLock m_lock;
	// Protected by `m_lock`
	std::deque<MainThreadCallback> m_callbacks;

	bool tryPop(MainThreadCallback &callback);
};

} // namespace tickbridge::bridge
