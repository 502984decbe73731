#pragma once

#include <tickbridge/visibility.hpp>
#include <tickbridge/world/events.hpp>

#include <memory>
#include <source_location>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>
#include <utility>
#include <vector>

namespace tickbridge::world
{

// Single-threaded owner of the authoritative state. Holds at most one
// resource object per C++ type and the event stores (`Events<T>` are
// resources too, registered for per-tick rotation when inserted).
//
// Nothing here is thread-safe. Background tasks reach the world only
// through `bridge::TaskContext::runOnMainThread()`.
class TICKBRIDGE_API World {
public:
	World();
	World(World &&) = delete;
	World(const World &) = delete;
	World &operator=(World &&) = delete;
	World &operator=(const World &) = delete;
	~World();

	// Construct resource of type `T`, replacing the existing one (if any)
	template<typename T, typename... Args>
	T &insertResource(Args &&...args)
	{
		ResourcePtr ptr(new T(std::forward<Args>(args)...), [](void *p) { delete static_cast<T *>(p); });
		T *raw = static_cast<T *>(ptr.get());

		IEventStore *store = nullptr;
		if constexpr (std::is_base_of_v<IEventStore, T>) {
			store = raw;
		}

		insertErased(typeid(T), std::move(ptr), store);
		return *raw;
	}

	// Returns nullptr if there is no resource of type `T`
	template<typename T>
	T *findResource() noexcept
	{
		return static_cast<T *>(findErased(typeid(T)));
	}

	template<typename T>
	const T *findResource() const noexcept
	{
		return static_cast<const T *>(findErased(typeid(T)));
	}

	// Throws `Exception` with `BridgeErrc::ResourceMissing` if there is no resource of type `T`
	template<typename T>
	T &resource(std::source_location loc = std::source_location::current())
	{
		T *res = findResource<T>();
		if (!res) [[unlikely]] {
			throwMissing(typeid(T), loc);
		}
		return *res;
	}

	template<typename T>
	bool hasResource() const noexcept
	{
		return findErased(typeid(T)) != nullptr;
	}

	// Returns false if there was nothing to remove
	template<typename T>
	bool removeResource() noexcept
	{
		return removeErased(typeid(T));
	}

	// Create `Events<T>` store if it does not exist yet
	template<typename T>
	Events<T> &initEvents()
	{
		if (Events<T> *events = findResource<Events<T>>(); events) {
			return *events;
		}
		return insertResource<Events<T>>();
	}

	// Throws `Exception` with `BridgeErrc::ResourceMissing` if `initEvents<T>()` was not called
	template<typename T>
	Events<T> &events(std::source_location loc = std::source_location::current())
	{
		return resource<Events<T>>(loc);
	}

	// Shortcut for `events<T>().send(value)`
	template<typename T>
	uint64_t sendEvent(T value, std::source_location loc = std::source_location::current())
	{
		return events<T>(loc).send(std::move(value));
	}

	// Rotate buffers of every event store, in the order they were created.
	// Called once per tick by `bridge::BridgeHandle::tickPump()`.
	void updateEvents();

	size_t numResources() const noexcept { return m_resources.size(); }
	size_t numEventStores() const noexcept { return m_event_stores.size(); }

private:
	using ResourcePtr = std::unique_ptr<void, void (*)(void *)>;

	struct EventStoreEntry {
		std::type_index type;
		IEventStore *store;
	};

	std::unordered_map<std::type_index, ResourcePtr> m_resources;
	std::vector<EventStoreEntry> m_event_stores;

	void insertErased(std::type_index type, ResourcePtr ptr, IEventStore *store);
	void *findErased(std::type_index type) const noexcept;
	bool removeErased(std::type_index type) noexcept;
	void unregisterEventStore(std::type_index type) noexcept;

	[[noreturn]] static void throwMissing(const std::type_info &type, std::source_location loc);
};

} // namespace tickbridge::world
