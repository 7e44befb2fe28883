#pragma once

#include "network/name_resolver.hpp"

namespace lantern::network {

inline constexpr std::chrono::milliseconds kDefaultSsdpWindow{2500};
inline constexpr std::chrono::milliseconds kDefaultSsdpFetchTimeout{2000};

/**
 * SsdpResolver - names from UPnP device descriptions.
 *
 * Sends one `M-SEARCH ssdp:all`, keeps the first LOCATION per responding
 * address, then fetches each description and takes its friendlyName.
 */
class SsdpResolver final : public NameResolver {
public:
    explicit SsdpResolver(std::chrono::milliseconds window = kDefaultSsdpWindow,
                          std::chrono::milliseconds fetch_timeout = kDefaultSsdpFetchTimeout)
        : window_(window), fetch_timeout_(fetch_timeout) {}

    [[nodiscard]] std::string name() const override { return "ssdp"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override {
        return window_ + fetch_timeout_;
    }

    NameMap resolve(const std::vector<std::string>& ips) override;

private:
    std::map<std::string, std::string> collect_locations(const std::vector<std::string>& ips);
    NameMap fetch_names(const std::map<std::string, std::string>& locations);

    std::chrono::milliseconds window_;
    std::chrono::milliseconds fetch_timeout_;
};

} // namespace lantern::network
