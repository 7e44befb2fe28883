#pragma once

#include "storage/database.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include <optional>
#include <vector>

namespace lantern::storage {

/**
 * EventRepository - append-only device history and domain events.
 *
 * Rows are never updated. History is pruned only through
 * prune_history_before().
 */
class EventRepository {
public:
    explicit EventRepository(Database& db) : db_(db) {}

    // History
    [[nodiscard]] Status append_history(
        const Uuid& device_id,
        DeviceStatus status,
        std::optional<int> latency_ms,
        Timestamp timestamp);
    [[nodiscard]] Result<std::vector<DeviceHistoryEntry>, Error> history_for(const Uuid& device_id);
    [[nodiscard]] Result<int64_t, Error> count_history(const Uuid& device_id);

    /**
     * Delete history rows older than `cutoff`. Returns the number removed.
     */
    [[nodiscard]] Result<int64_t, Error> prune_history_before(Timestamp cutoff);

    // Events

    /**
     * Insert an event and its metadata rows. Returns the new event id.
     */
    [[nodiscard]] Result<int64_t, Error> append_event(const DomainEvent& event);

    /**
     * Newest first, at most `limit` rows.
     */
    [[nodiscard]] Result<std::vector<DomainEvent>, Error> events(int limit = 100);
    [[nodiscard]] Result<std::vector<DomainEvent>, Error> events_for_device(const Uuid& device_id);
    [[nodiscard]] Result<int64_t, Error> count_events(EventKind kind);

private:
    Database& db_;

    [[nodiscard]] Result<std::vector<DomainEvent>, Error> query_events(
        const std::string& sql, const std::optional<std::string>& device_key, int limit);
    [[nodiscard]] Status load_metadata(DomainEvent& event);
};

} // namespace lantern::storage
