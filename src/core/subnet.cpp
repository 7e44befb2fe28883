#include "core/subnet.hpp"

#include <array>
#include <bit>
#include <cctype>
#include <charconv>
#include <vector>

namespace lantern {
namespace {

std::vector<std::string_view> split(std::string_view text, char sep) {
    std::vector<std::string_view> parts;
    size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string_view::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

std::optional<unsigned> parse_decimal(std::string_view text, unsigned max) {
    if (text.empty() || text.size() > 3) return std::nullopt;
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size() || value > max) {
        return std::nullopt;
    }
    return value;
}

} // namespace

std::optional<uint32_t> parse_ipv4(std::string_view text) {
    auto parts = split(text, '.');
    if (parts.size() != 4) return std::nullopt;

    uint32_t address = 0;
    for (auto part : parts) {
        auto octet = parse_decimal(part, 255);
        if (!octet) return std::nullopt;
        address = (address << 8) | *octet;
    }
    return address;
}

std::string format_ipv4(uint32_t address) {
    return std::to_string((address >> 24) & 0xFF) + "." +
           std::to_string((address >> 16) & 0xFF) + "." +
           std::to_string((address >> 8) & 0xFF) + "." +
           std::to_string(address & 0xFF);
}

std::optional<int> netmask_to_prefix(uint32_t netmask) {
    int prefix = std::popcount(netmask);
    uint32_t expected = prefix == 0 ? 0u : ~uint32_t{0} << (32 - prefix);
    if (expected != netmask) return std::nullopt;
    return prefix;
}

std::optional<std::string> reverse_pointer_name(std::string_view ip) {
    auto address = parse_ipv4(ip);
    if (!address) return std::nullopt;
    return std::to_string(*address & 0xFF) + "." +
           std::to_string((*address >> 8) & 0xFF) + "." +
           std::to_string((*address >> 16) & 0xFF) + "." +
           std::to_string((*address >> 24) & 0xFF) + ".in-addr.arpa";
}

std::optional<std::string> ip_from_reverse_pointer_name(std::string_view name) {
    if (!name.empty() && name.back() == '.') name.remove_suffix(1);

    constexpr std::string_view suffix = ".in-addr.arpa";
    if (name.size() <= suffix.size()) return std::nullopt;
    auto tail = name.substr(name.size() - suffix.size());
    for (size_t i = 0; i < suffix.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(tail[i])) != suffix[i]) return std::nullopt;
    }

    auto parts = split(name.substr(0, name.size() - suffix.size()), '.');
    if (parts.size() != 4) return std::nullopt;
    std::string ip = std::string(parts[3]) + "." + std::string(parts[2]) + "." +
                     std::string(parts[1]) + "." + std::string(parts[0]);
    if (!parse_ipv4(ip)) return std::nullopt;
    return ip;
}

std::optional<Subnet> Subnet::parse(std::string_view cidr) {
    auto slash = cidr.find('/');
    if (slash == std::string_view::npos) return std::nullopt;

    auto address = parse_ipv4(cidr.substr(0, slash));
    auto prefix = parse_decimal(cidr.substr(slash + 1), 32);
    if (!address || !prefix) return std::nullopt;

    Subnet subnet{0, static_cast<int>(*prefix)};
    subnet.network = *address & subnet.netmask();
    return subnet;
}

std::optional<Subnet> Subnet::from_interface(uint32_t ip, uint32_t netmask) {
    auto prefix = netmask_to_prefix(netmask);
    if (!prefix) return std::nullopt;
    return Subnet{ip & netmask, *prefix};
}

std::string Subnet::to_string() const {
    return format_ipv4(network) + "/" + std::to_string(prefix);
}

} // namespace lantern
