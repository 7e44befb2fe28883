#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lantern {

/**
 * Partial result of one name resolution strategy: ip -> name.
 */
using NameMap = std::map<std::string, std::string>;

/**
 * Prefix some reverse-DNS providers use for synthesized names
 * (ip-192-168-1-10.example.internal).
 */
inline constexpr std::string_view kSyntheticDnsPrefix = "ip-";

/**
 * True when `name` carries no information beyond the address itself: empty,
 * the IP literal, or a provider-synthesized default.
 */
[[nodiscard]] bool is_identity_name(std::string_view name, std::string_view ip);

/**
 * Pick the name for one host.
 *
 * `ranked` holds resolver outputs ordered from highest to lowest priority
 * (mDNS, SSDP, reverse DNS, NetBIOS). The first entry with a non-identity
 * name for `ip` wins; the swept hostname is the last candidate. Returns
 * nullopt when nothing qualifies.
 */
[[nodiscard]] std::optional<std::string> merge_name(
    std::string_view ip,
    const std::vector<NameMap>& ranked,
    const std::optional<std::string>& swept_hostname);

} // namespace lantern
