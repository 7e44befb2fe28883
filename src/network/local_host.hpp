#pragma once

#include "core/result.hpp"
#include "core/subnet.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace lantern::network {

/**
 * LocalInterface - the host's own address on the scanned network.
 */
struct LocalInterface {
    std::string ip;
    uint32_t netmask = 0;
    std::optional<std::string> mac;
    std::string hostname;

    [[nodiscard]] std::optional<Subnet> subnet() const;
};

/**
 * First running, non-loopback interface with an IPv4 address.
 * `mac` is absent when the interface reports none or all zeros.
 */
[[nodiscard]] Result<LocalInterface, Error> detect_local_interface();

} // namespace lantern::network
