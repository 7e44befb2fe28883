#include "core/name_merge.hpp"

namespace lantern {

bool is_identity_name(std::string_view name, std::string_view ip) {
    if (name.empty() || name == ip) return true;
    return name.substr(0, kSyntheticDnsPrefix.size()) == kSyntheticDnsPrefix;
}

std::optional<std::string> merge_name(
    std::string_view ip,
    const std::vector<NameMap>& ranked,
    const std::optional<std::string>& swept_hostname)
{
    const std::string key(ip);
    for (const auto& names : ranked) {
        auto it = names.find(key);
        if (it != names.end() && !is_identity_name(it->second, ip)) {
            return it->second;
        }
    }

    if (swept_hostname && !is_identity_name(*swept_hostname, ip)) {
        return swept_hostname;
    }
    return std::nullopt;
}

} // namespace lantern
