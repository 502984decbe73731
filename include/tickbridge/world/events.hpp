#pragma once

#include <tickbridge/util/log.hpp>

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace tickbridge::world
{

// Type-erased part of `Events<T>` used by `World::updateEvents()`
class IEventStore {
public:
	IEventStore() = default;
	IEventStore(IEventStore &&) = delete;
	IEventStore(const IEventStore &) = delete;
	IEventStore &operator=(IEventStore &&) = delete;
	IEventStore &operator=(const IEventStore &) = delete;
	virtual ~IEventStore() = default;

	virtual void update() = 0;
};

// Double-buffered, poll-based storage of events of type `T`.
//
// `send()` appends to the current buffer. `update()` is called once per
// tick: it drops the older buffer and makes the current one older.
// An event therefore stays readable for two updates, which lets readers
// running before and after the sender in the same tick both see it.
//
// Every event gets a sequential id, readers use it as a cursor (see `EventReader`).
// Not thread-safe, owned by `World` and touched only from the world thread.
template<typename T>
class Events final : public IEventStore {
public:
	struct Entry {
		uint64_t id;
		T value;
	};

	Events() = default;
	~Events() override = default;

	// Returns id of the added event
	uint64_t send(T value)
	{
		uint64_t id = m_next_id++;
		m_current.push_back(Entry { id, std::move(value) });
		return id;
	}

	void update() override
	{
		std::swap(m_older, m_current);
		m_current.clear();
	}

	// Drop all stored events. Ids keep counting, readers will observe them as missed.
	void clear() noexcept
	{
		m_older.clear();
		m_current.clear();
	}

	// Number of stored (readable) events
	size_t len() const noexcept { return m_older.size() + m_current.size(); }
	bool empty() const noexcept { return m_older.empty() && m_current.empty(); }

	// Id the next sent event will get
	uint64_t nextId() const noexcept { return m_next_id; }

	// Id of the oldest stored event, or `nextId()` if nothing is stored
	uint64_t oldestId() const noexcept
	{
		if (!m_older.empty()) {
			return m_older.front().id;
		}
		if (!m_current.empty()) {
			return m_current.front().id;
		}
		return m_next_id;
	}

	// Call `fn(const Entry &)` for every stored event with id >= `first_id`, oldest first
	template<typename F>
	void forEachSince(uint64_t first_id, F &&fn) const
	{
		for (const auto *buffer : { &m_older, &m_current }) {
			for (const Entry &entry : *buffer) {
				if (entry.id >= first_id) {
					fn(entry);
				}
			}
		}
	}

private:
	std::vector<Entry> m_older;
	std::vector<Entry> m_current;
	uint64_t m_next_id = 0;
};

// Cursor over `Events<T>`, each event is returned by `read()` at most once.
// Keep one reader per consumer, e.g. as a member of some system object.
template<typename T>
class EventReader {
public:
	EventReader() = default;
	// Create reader that skips all events already stored in `events`
	static EventReader startingAfter(const Events<T> &events) noexcept
	{
		EventReader reader;
		reader.m_cursor = events.nextId();
		return reader;
	}

	// Get all events not yet seen by this reader, oldest first.
	// Returned references are valid until the next `Events::update()` or `send()`.
	std::vector<std::reference_wrapper<const T>> read(const Events<T> &events)
	{
		if (m_cursor > events.nextId()) [[unlikely]] {
			// Store was replaced with a fresh one, its ids restarted
			Log::debug("EventReader cursor {} is ahead of event store (next id {}), rewinding", m_cursor,
				events.nextId());
			m_cursor = events.oldestId();
		}

		uint64_t oldest = events.oldestId();
		if (oldest > m_cursor) [[unlikely]] {
			// Reader was not polled for two or more updates
			Log::warn("EventReader missed {} events (cursor {}, oldest stored {})", oldest - m_cursor, m_cursor,
				oldest);
			m_cursor = oldest;
		}

		std::vector<std::reference_wrapper<const T>> result;
		result.reserve(events.nextId() - m_cursor);
		events.forEachSince(m_cursor, [&](const typename Events<T>::Entry &entry) { result.emplace_back(entry.value); });

		m_cursor = events.nextId();
		return result;
	}

	// Number of events `read()` would return now
	size_t unread(const Events<T> &events) const noexcept
	{
		if (m_cursor > events.nextId()) [[unlikely]] {
			return events.len();
		}

		uint64_t first = std::max(m_cursor, events.oldestId());
		return static_cast<size_t>(events.nextId() - first);
	}

	uint64_t cursor() const noexcept { return m_cursor; }

private:
	uint64_t m_cursor = 0;
};

} // namespace tickbridge::world
