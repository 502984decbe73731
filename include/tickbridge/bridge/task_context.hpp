#pragma once

#include <tickbridge/bridge/bridge_fwd.hpp>
#include <tickbridge/bridge/main_thread_queue.hpp>
#include <tickbridge/bridge/tick_clock.hpp>
#include <tickbridge/svc/response_slot.hpp>
#include <tickbridge/svc/task_coro.hpp>
#include <tickbridge/util/log.hpp>
#include <tickbridge/visibility.hpp>
#include <tickbridge/world/tick_id.hpp>

#include <concepts>
#include <cstdint>
#include <memory>
#include <type_traits>
#include <utility>
#include <variant>

namespace tickbridge::bridge
{

namespace detail
{

// State shared by a bridge and every `TaskContext` cloned from it.
// Tasks may outlive the bridge (with an externally owned task service),
// then they see a closed clock and a closed queue.
struct BridgeShared {
	BridgeShared(world::TickId start_tick, MainThreadQueue::Config queue_cfg) noexcept
		: clock(start_tick), queue(queue_cfg)
	{}

	TickClock clock;
	MainThreadQueue queue;
};

} // namespace detail

// Capability handed to every background task. Cheap to copy,
// all copies refer to the same clock and main thread queue.
//
// Its suspending methods must be awaited from a task coroutine:
//
//   svc::CoroTask myTask(bridge::TaskContext ctx)
//   {
//     co_await ctx.sleepUpdates(5);
//     size_t n = co_await ctx.runOnMainThread([](MainThreadContext &mtc) {
//       return mtc.world.numResources();
//     });
//   }
class TICKBRIDGE_API TaskContext {
public:
	explicit TaskContext(std::shared_ptr<detail::BridgeShared> shared) noexcept : m_shared(std::move(shared)) {}
	TaskContext(TaskContext &&) = default;
	TaskContext(const TaskContext &) = default;
	TaskContext &operator=(TaskContext &&) = default;
	TaskContext &operator=(const TaskContext &) = default;
	~TaskContext() = default;

	// Non-suspending read, possibly outdated by the time it's used
	world::TickId currentTick() const noexcept { return m_shared->clock.current(); }

	// Suspend until the tick advanced by at least `n` from its value at the time of this call.
	// Several advances between wakeups are fine, the distance is checked, not wakeups counted.
	// Throws `Exception` with `BridgeErrc::ClockClosed` if the world is torn down meanwhile.
	svc::CoroSubTask<void> sleepUpdates(uint64_t n) const;

	// Execute `fn(MainThreadContext &)` on the world thread during the next
	// pump and resume with its return value. `fn` is taken by value and
	// destroyed on the world thread.
	//
	// Throws `Exception` with:
	// - `BridgeErrc::WorldUnavailable` if the world is torn down and nothing was queued
	// - `BridgeErrc::ResponseLost` if `fn` was queued but never delivered a value
	//   (it threw, or the world was torn down before the pump reached it)
	//
	// If the awaiting task is cancelled meanwhile, `fn` still runs and its result is discarded.
	template<typename F>
		requires std::invocable<F &, MainThreadContext &>
	svc::CoroSubTask<std::invoke_result_t<F &, MainThreadContext &>> runOnMainThread(F fn) const
	{
		return doRunOnMainThread<std::invoke_result_t<F &, MainThreadContext &>>(m_shared, std::move(fn));
	}

	// Whether main thread work can still be queued
	bool worldAvailable() const noexcept { return !m_shared->queue.closed(); }

private:
	std::shared_ptr<detail::BridgeShared> m_shared;

	static svc::CoroSubTask<void> doSleepUpdates(std::shared_ptr<detail::BridgeShared> shared, uint64_t n,
		world::TickId start);

	template<typename R, typename F>
	static svc::CoroSubTask<R> doRunOnMainThread(std::shared_ptr<detail::BridgeShared> shared, F fn)
	{
		// `void` results are delivered as an empty value
		using Slot = std::conditional_t<std::is_void_v<R>, std::monostate, R>;

		auto [sender, receiver] = svc::makeResponseSlot<Slot>();

		shared->queue.enqueue([fn = std::move(fn), tx = std::move(sender)](MainThreadContext &ctx) mutable {
			bool delivered;
			if constexpr (std::is_void_v<R>) {
				fn(ctx);
				delivered = tx.send(std::monostate {});
			} else {
				delivered = tx.send(fn(ctx));
			}

			if (!delivered) {
				Log::debug("Main thread callback result at tick {} discarded, awaiting task is gone",
					ctx.current_tick.value);
			}
		});

		if constexpr (std::is_void_v<R>) {
			co_await receiver;
		} else {
			co_return co_await receiver;
		}
	}
};

} // namespace tickbridge::bridge
