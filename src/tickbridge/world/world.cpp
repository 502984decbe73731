#include <tickbridge/world/world.hpp>

#include <tickbridge/util/error_condition.hpp>
#include <tickbridge/util/exception.hpp>
#include <tickbridge/util/log.hpp>

#include <fmt/format.h>

#include <algorithm>

namespace tickbridge::world
{

World::World() = default;

World::~World()
{
	// Event stores are resources, forget them before the map frees them
	m_event_stores.clear();
	m_resources.clear();
}

void World::updateEvents()
{
	for (const EventStoreEntry &entry : m_event_stores) {
		entry.store->update();
	}
}

void World::insertErased(std::type_index type, ResourcePtr ptr, IEventStore *store)
{
	// Replaced object (if any) is destroyed after its store entry is gone
	unregisterEventStore(type);

	auto [iter, inserted] = m_resources.try_emplace(type, std::move(ptr));
	if (!inserted) {
		std::swap(iter->second, ptr);
	}

	if (store) {
		m_event_stores.emplace_back(EventStoreEntry { type, store });
		Log::debug("Registered event store '{}'", type.name());
	}
}

void *World::findErased(std::type_index type) const noexcept
{
	auto iter = m_resources.find(type);
	return iter != m_resources.end() ? iter->second.get() : nullptr;
}

bool World::removeErased(std::type_index type) noexcept
{
	auto iter = m_resources.find(type);
	if (iter == m_resources.end()) {
		return false;
	}

	unregisterEventStore(type);
	m_resources.erase(iter);
	return true;
}

void World::unregisterEventStore(std::type_index type) noexcept
{
	std::erase_if(m_event_stores, [type](const EventStoreEntry &entry) { return entry.type == type; });
}

void World::throwMissing(const std::type_info &type, std::source_location loc)
{
	auto msg = fmt::format("no resource of type '{}' in the world", type.name());
	throw Exception::fromError(BridgeErrc::ResourceMissing, msg.c_str(), loc);
}

} // namespace tickbridge::world
