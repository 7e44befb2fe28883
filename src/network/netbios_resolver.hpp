#pragma once

#include "network/name_resolver.hpp"

#include <QString>

namespace lantern::network {

inline constexpr std::chrono::milliseconds kDefaultNetbiosTimeout{1500};
inline constexpr int kNetbiosMaxInFlight = 16;

/**
 * NetbiosResolver - node status queries through Samba's nmblookup.
 *
 * At most kNetbiosMaxInFlight lookups run at once; each is killed after the
 * per-host timeout.
 */
class NetbiosResolver final : public NameResolver {
public:
    explicit NetbiosResolver(std::chrono::milliseconds per_host = kDefaultNetbiosTimeout,
                             QString program = QStringLiteral("nmblookup"))
        : per_host_(per_host), program_(std::move(program)) {}

    [[nodiscard]] std::string name() const override { return "netbios"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return per_host_; }

    NameMap resolve(const std::vector<std::string>& ips) override;

private:
    std::chrono::milliseconds per_host_;
    QString program_;
};

} // namespace lantern::network
