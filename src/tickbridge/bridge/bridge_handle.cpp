#include <tickbridge/bridge/bridge_handle.hpp>

#include <tickbridge/debug/bug_found.hpp>
#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>

#include <fmt/format.h>

#include <mutex>

namespace tickbridge::bridge
{

BridgeHandle::BridgeHandle(world::World &world, Config cfg)
	: BridgeHandle(world, std::make_unique<svc::TaskService>(cfg.task_service), nullptr, cfg)
{}

BridgeHandle::BridgeHandle(world::World &world, svc::TaskService &task_service, Config cfg)
	: BridgeHandle(world, nullptr, &task_service, cfg)
{}

BridgeHandle::BridgeHandle(world::World &world, std::unique_ptr<svc::TaskService> owned,
	svc::TaskService *external, Config cfg)
	: m_owned_task_service(std::move(owned))
	, m_task_service(external ? *external : *m_owned_task_service)
	, m_world(world)
	, m_shared(std::make_shared<detail::BridgeShared>(cfg.start_tick, cfg.main_thread_queue))
{
	if (world.hasResource<detail::AttachedBridge>()) {
		throw Exception::fromError(BridgeErrc::DuplicateBridge, "world already has a bridge attached");
	}

	world.insertResource<detail::AttachedBridge>(this);

	Log::info("Bridge attached: {} task worker threads, main thread drain limit {}", m_task_service.numThreads(),
		cfg.main_thread_queue.max_callbacks_per_tick);
}

BridgeHandle::~BridgeHandle()
{
	// Wake everyone waiting on us before the task service goes away.
	// Queue goes first: a sleeper woken by the clock must not get its
	// next callback accepted and then silently dropped.
	m_shared->queue.close();
	m_shared->clock.close();

	m_world.removeResource<detail::AttachedBridge>();
	Log::info("Bridge detached at tick {}", currentTick().value);
}

world::TickId BridgeHandle::tickPump()
{
	std::unique_lock guard(m_pump_guard, std::try_to_lock);
	if (!guard.owns_lock()) [[unlikely]] {
		debug::bugFound(fmt::format("{}: tick pump entered concurrently or re-entrantly",
			make_error_condition(BridgeErrc::InvariantViolation).message()));
	}

	world::TickId tick = m_shared->clock.advance();
	m_world.updateEvents();

	size_t bridged = 0;
	for (const auto &bridge : m_bridges) {
		bridged += bridge->drainStep(m_world);
	}

	size_t executed = m_shared->queue.drainAll(m_world, tick);

	Log::trace("Tick {}: {} events bridged, {} main thread callbacks executed", tick.value, bridged, executed);
	return tick;
}

void BridgeHandle::throwAlreadyBridged(const std::type_info &type)
{
	auto msg = fmt::format("event type '{}' already has a channel bridge in this world", type.name());
	throw Exception::fromError(BridgeErrc::DuplicateBridge, msg);
}

void BridgeHandle::addBridge(std::unique_ptr<detail::IChannelEventBridge> bridge)
{
	const std::type_info &type = bridge->eventType();
	m_bridges.emplace_back(std::move(bridge));

	Log::debug("Registered channel bridge for event type '{}'", type.name());
}

} // namespace tickbridge::bridge
