#pragma once

#include "core/device.hpp"
#include <string_view>

namespace lantern {

/**
 * Map an OUI vendor string and an OS guess to a coarse device type.
 *
 * Both inputs may be empty and are matched case-insensitively. Rules are
 * evaluated in a fixed order and the first match wins:
 *   virtualization vendor -> vm
 *   Microsoft vendor with a Linux OS (Hyper-V/Azure guest) -> vm
 *   phone/tablet vendor -> mobile
 *   PC maker -> laptop
 *   smart-home vendor -> iot
 *   networking gear -> router
 *   NAS vendor -> server
 *   OS contains "windows" -> laptop
 *   OS contains "linux" -> server
 *   otherwise unknown
 */
[[nodiscard]] DeviceType classify(std::string_view vendor, std::string_view os);

} // namespace lantern
