#include "core/classifier.hpp"

#include <string>
#include <vector>

namespace lantern {
namespace {

struct VendorRule {
    std::vector<std::string_view> tokens;
    DeviceType type;
};

bool contains_any(const std::string& haystack, const std::vector<std::string_view>& tokens) {
    for (auto token : tokens) {
        if (haystack.find(token) != std::string::npos) return true;
    }
    return false;
}

bool contains(const std::string& haystack, std::string_view token) {
    return haystack.find(token) != std::string::npos;
}

// Order matters: earlier rules shadow later ones.
const std::vector<VendorRule>& vendor_rules() {
    static const std::vector<VendorRule> rules{
        {{"apple", "samsung", "motorola", "google", "xiaomi", "oneplus", "huawei"}, DeviceType::Mobile},
        {{"dell", "hp", "hewlett", "lenovo", "acer"}, DeviceType::Laptop},
        {{"philips", "hue", "nest", "raspberry", "arduino", "espressif", "tuya", "sonos"}, DeviceType::Iot},
        {{"ubiquiti", "cisco", "tplink", "tp-link", "netgear", "mikrotik", "zyxel", "linksys"}, DeviceType::Router},
        {{"synology", "qnap", "asustor"}, DeviceType::Server},
    };
    return rules;
}

const std::vector<std::string_view> kVirtualizationTokens{
    "vmware", "virtualbox", "qemu", "xen", "parallels", "hyper-v", "proxmox"
};

} // namespace

DeviceType classify(std::string_view vendor, std::string_view os) {
    const auto v = to_lower(vendor);
    const auto o = to_lower(os);

    if (contains_any(v, kVirtualizationTokens)) {
        return DeviceType::Vm;
    }
    if (contains(v, "microsoft") && contains(o, "linux")) {
        return DeviceType::Vm;
    }

    for (const auto& rule : vendor_rules()) {
        if (contains_any(v, rule.tokens)) return rule.type;
    }

    if (contains(o, "windows")) return DeviceType::Laptop;
    if (contains(o, "linux")) return DeviceType::Server;

    return DeviceType::Unknown;
}

} // namespace lantern
