#pragma once

#include "core/name_merge.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace lantern::network {

/**
 * NameResolver - one strategy for turning addresses into names.
 *
 * resolve() blocks for at most timeout() (plus scheduling slack), never
 * throws, and returns only the addresses it could name. A failed strategy
 * returns an empty map.
 */
class NameResolver {
public:
    virtual ~NameResolver() = default;

    [[nodiscard]] virtual std::string name() const = 0;
    [[nodiscard]] virtual std::chrono::milliseconds timeout() const = 0;

    virtual NameMap resolve(const std::vector<std::string>& ips) = 0;
};

} // namespace lantern::network
