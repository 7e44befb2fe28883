#pragma once

#include "core/device.hpp"
#include "core/result.hpp"
#include "core/subnet.hpp"
#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace lantern::network {

/**
 * SweptHost - one responding address from a subnet sweep.
 *
 * `mac` is normalized; hosts the prober could not attribute (the local host,
 * hosts behind a router) have none.
 */
struct SweptHost {
    std::string ip;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;
    std::optional<std::string> hostname;

    bool operator==(const SweptHost&) const = default;
};

/**
 * Fingerprint - result of a single-host deep probe.
 */
struct Fingerprint {
    std::string os_guess;
    std::vector<OpenPort> open_ports;
    std::string details_json;
};

/**
 * ActiveProber - host discovery and OS/port fingerprinting.
 *
 * Both calls block for as long as the probe takes (tens of seconds is
 * normal) and are bounded by `timeout`.
 */
class ActiveProber {
public:
    virtual ~ActiveProber() = default;

    [[nodiscard]] virtual Result<std::vector<SweptHost>, Error> sweep(
        const Subnet& subnet, std::chrono::milliseconds timeout) = 0;

    [[nodiscard]] virtual Result<Fingerprint, Error> fingerprint(
        const std::string& ip, std::chrono::milliseconds timeout) = 0;
};

} // namespace lantern::network
