#pragma once

#include "network/name_resolver.hpp"

#include <optional>

namespace lantern::network {

inline constexpr std::chrono::milliseconds kDefaultDnsTimeout{3000};

/**
 * DnsResolver - unicast reverse (PTR) lookups, all hosts in parallel.
 *
 * Uses the system resolver unless `nameserver` names a server to ask.
 */
class DnsResolver final : public NameResolver {
public:
    explicit DnsResolver(std::optional<std::string> nameserver = std::nullopt,
                         std::chrono::milliseconds timeout = kDefaultDnsTimeout)
        : nameserver_(std::move(nameserver)), timeout_(timeout) {}

    [[nodiscard]] std::string name() const override { return "dns"; }
    [[nodiscard]] std::chrono::milliseconds timeout() const override { return timeout_; }

    NameMap resolve(const std::vector<std::string>& ips) override;

private:
    std::optional<std::string> nameserver_;
    std::chrono::milliseconds timeout_;
};

} // namespace lantern::network
