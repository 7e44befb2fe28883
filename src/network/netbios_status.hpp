#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace lantern::network {

/**
 * Machine name from `nmblookup -A <ip>` output.
 *
 * Name table lines look like "\tHOSTNAME        <00> -         B <ACTIVE>".
 * The first `<00>` entry not flagged `<GROUP>` is the workstation name;
 * group entries carry the workgroup and are skipped.
 */
[[nodiscard]] std::optional<std::string> parse_nmblookup_status(std::string_view output);

} // namespace lantern::network
