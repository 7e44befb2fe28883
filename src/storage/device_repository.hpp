#pragma once

#include "storage/database.hpp"
#include "core/device.hpp"
#include "core/result.hpp"
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace lantern::storage {

/**
 * DeviceRepository - data access for the device registry and port snapshots.
 *
 * The MAC column is UNIQUE; every lookup used during reconciliation goes
 * through it.
 */
class DeviceRepository {
public:
    explicit DeviceRepository(Database& db) : db_(db) {}

    [[nodiscard]] Result<std::optional<Device>, Error> find_by_mac(const std::string& mac);
    [[nodiscard]] Result<std::optional<Device>, Error> find_by_id(const Uuid& id);

    /**
     * Most recently seen device currently holding `ip`.
     */
    [[nodiscard]] Result<std::optional<Device>, Error> find_by_ip(const std::string& ip);

    [[nodiscard]] Result<std::vector<Device>, Error> all();
    [[nodiscard]] Result<int64_t, Error> count();

    [[nodiscard]] Status insert(const Device& device);

    /**
     * Overwrite the sighting columns of the row with `device.id`. The type is
     * filled only while the stored type is unknown; os and details are
     * written only by apply_fingerprint() and clear_fingerprint(), tags only
     * by set_tags().
     */
    [[nodiscard]] Status update(const Device& device);

    [[nodiscard]] Status set_status(const Uuid& id, DeviceStatus status);
    [[nodiscard]] Status set_tags(const Uuid& id, const std::set<std::string>& tags);
    [[nodiscard]] Status remove(const Uuid& id);

    /**
     * Store a fingerprint and its port snapshot unless the device already has
     * an OS.
     *
     * The claim (`WHERE os = ''`) and the port replacement run in one
     * transaction: either both land or the device is left untouched. The type
     * is replaced only while it is still unknown. Returns ok(true) when the
     * row was claimed.
     */
    [[nodiscard]] Result<bool, Error> apply_fingerprint(
        const Uuid& id,
        const std::string& os,
        const std::string& details,
        DeviceType classified_type,
        const std::vector<OpenPort>& ports);

    /**
     * Forget the stored fingerprint and ports so the next probe applies.
     */
    [[nodiscard]] Status clear_fingerprint(const Uuid& id);

    /**
     * Replace the port snapshot (delete, then insert each port).
     */
    [[nodiscard]] Status replace_ports(const Uuid& id, const std::vector<OpenPort>& ports);
    [[nodiscard]] Result<std::vector<OpenPort>, Error> ports(const Uuid& id);

private:
    Database& db_;

    [[nodiscard]] Result<std::optional<Device>, Error> find_one(
        const std::string& sql, const std::string& key);
    [[nodiscard]] static Device row_to_device(Statement& stmt);
    [[nodiscard]] Result<bool, Error> claim_fingerprint(const Uuid& id,
                                                        const std::string& os,
                                                        const std::string& details,
                                                        DeviceType classified_type);
};

/**
 * Tags are persisted as one comma separated column.
 */
[[nodiscard]] std::string join_tags(const std::set<std::string>& tags);
[[nodiscard]] std::set<std::string> split_tags(const std::string& text);

} // namespace lantern::storage
