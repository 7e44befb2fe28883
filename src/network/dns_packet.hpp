#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace lantern::network {

// Minimal DNS wire helpers for PTR lookups over mDNS.

inline constexpr uint16_t kDnsTypePtr = 12;
inline constexpr uint16_t kDnsClassIn = 1;

/**
 * One PTR record: `owner` is the queried name (x.x.x.x.in-addr.arpa),
 * `target` the host name it points to. Both without trailing dot.
 */
struct PtrRecord {
    std::string owner;
    std::string target;

    bool operator==(const PtrRecord&) const = default;
};

/**
 * Standard query for one PTR question. Fails when a label exceeds 63 bytes
 * or the name exceeds 255.
 */
[[nodiscard]] Result<QByteArray, Error> encode_ptr_query(uint16_t id, std::string_view qname);

/**
 * All PTR records in the answer, authority and additional sections of a
 * response. Compressed names are followed; records of other types are
 * skipped.
 */
[[nodiscard]] Result<std::vector<PtrRecord>, Error> parse_ptr_records(const QByteArray& packet);

} // namespace lantern::network
