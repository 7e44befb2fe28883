#pragma once

#include "network/name_resolver.hpp"

#include <memory>
#include <string_view>

namespace lantern::network {

inline constexpr std::chrono::milliseconds kDefaultMdnsWindow{2500};

/**
 * MdnsResolver - reverse lookups answered by multicast DNS responders.
 *
 * Sends one legacy-unicast PTR query per address to 224.0.0.251:5353 from an
 * ephemeral port and collects answers until the window closes.
 */
class MdnsResolver final : public NameResolver {
public:
    explicit MdnsResolver(std::chrono::milliseconds window = kDefaultMdnsWindow)
        : window_(window) {}

    [[nodiscard]] std::string name() const override { return "mdns"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return window_; }

    NameMap resolve(const std::vector<std::string>& ips) override;

private:
    std::chrono::milliseconds window_;
};

/**
 * Host name as shown to users: trailing dot and ".local" removed.
 */
[[nodiscard]] std::string strip_mdns_suffix(std::string_view host_name);

/**
 * Avahi's address resolver when built with Avahi and the daemon is
 * reachable, otherwise MdnsResolver. LANTERN_MDNS_BACKEND=multicast forces
 * MdnsResolver.
 */
[[nodiscard]] std::unique_ptr<NameResolver> create_mdns_resolver(
    std::chrono::milliseconds window = kDefaultMdnsWindow);

} // namespace lantern::network
