#pragma once

#include "core/result.hpp"
#include "network/active_prober.hpp"

#include <QByteArray>

namespace lantern::network {

// Parsers for nmap's XML report (`-oX -`). Kept apart from NmapProber so
// they can be tested against captured output without running nmap.

/**
 * Hosts of a ping sweep (`-sn`). Hosts whose status is not "up" are dropped.
 */
[[nodiscard]] Result<std::vector<SweptHost>, Error> parse_nmap_sweep(const QByteArray& xml);

/**
 * First host of an OS scan (`-O`). `os_guess` is the best osmatch name, or
 * empty when nmap could not tell; only ports in state "open" are kept.
 */
[[nodiscard]] Result<Fingerprint, Error> parse_nmap_fingerprint(const QByteArray& xml);

} // namespace lantern::network
