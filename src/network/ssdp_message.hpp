#pragma once

#include "core/result.hpp"

#include <QByteArray>
#include <optional>
#include <string>

namespace lantern::network {

/**
 * Headers of interest from one M-SEARCH response. Header names are matched
 * case-insensitively.
 */
struct SsdpResponse {
    std::string location;
    std::string server;
    std::string usn;
    std::string search_target;
};

/**
 * M-SEARCH request for `search_target` with an MX of `mx_seconds`.
 */
[[nodiscard]] QByteArray build_msearch(const std::string& search_target = "ssdp:all",
                                       int mx_seconds = 2);

/**
 * Parse an HTTP-over-UDP response. Fails unless the status line is
 * "HTTP/1.x 200" and a LOCATION header is present.
 */
[[nodiscard]] Result<SsdpResponse, Error> parse_ssdp_response(const QByteArray& datagram);

/**
 * <friendlyName> of the root device in a UPnP description document.
 */
[[nodiscard]] std::optional<std::string> parse_friendly_name(const QByteArray& description);

} // namespace lantern::network
