#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lantern {

/**
 * Parse dotted-quad IPv4 text into a host-order integer.
 */
[[nodiscard]] std::optional<uint32_t> parse_ipv4(std::string_view text);

[[nodiscard]] std::string format_ipv4(uint32_t address);

/**
 * Number of leading one bits of a contiguous netmask; nullopt when the mask
 * has holes (e.g. 255.0.255.0).
 */
[[nodiscard]] std::optional<int> netmask_to_prefix(uint32_t netmask);

/**
 * Name queried for a reverse (PTR) lookup: 10.1.168.192.in-addr.arpa
 */
[[nodiscard]] std::optional<std::string> reverse_pointer_name(std::string_view ip);

/**
 * Inverse of reverse_pointer_name; accepts an optional trailing dot.
 */
[[nodiscard]] std::optional<std::string> ip_from_reverse_pointer_name(std::string_view name);

/**
 * Subnet - an IPv4 network in CIDR form.
 */
struct Subnet {
    uint32_t network = 0;
    int prefix = 0;

    /**
     * Parse "a.b.c.d/n". Host bits in the address are cleared.
     */
    [[nodiscard]] static std::optional<Subnet> parse(std::string_view cidr);

    /**
     * Network of an interface address: ip AND netmask.
     */
    [[nodiscard]] static std::optional<Subnet> from_interface(uint32_t ip, uint32_t netmask);

    [[nodiscard]] uint32_t netmask() const noexcept {
        return prefix == 0 ? 0u : ~uint32_t{0} << (32 - prefix);
    }

    [[nodiscard]] bool contains(uint32_t address) const noexcept {
        return (address & netmask()) == network;
    }

    [[nodiscard]] std::string to_string() const;

    bool operator==(const Subnet&) const = default;
};

} // namespace lantern
