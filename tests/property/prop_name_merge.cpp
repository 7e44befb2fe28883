#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/name_merge.hpp"

#include <optional>
#include <string>
#include <vector>

using namespace lantern;

namespace {

const std::string kIp = "192.168.1.20";

// Real names, identity names, or nothing at all for kIp.
rc::Gen<NameMap> name_map_gen() {
    auto real = rc::gen::map(rc::gen::nonEmpty(rc::gen::string<std::string>()),
                             [](std::string s) { return "host-" + s; });
    auto identity = rc::gen::elementOf(std::vector<std::string>{
        "", kIp, "ip-192-168-1-20.ec2.internal"});

    return rc::gen::oneOf(
        rc::gen::just(NameMap{}),
        rc::gen::map(real, [](std::string name) { return NameMap{{kIp, name}}; }),
        rc::gen::map(identity, [](std::string name) { return NameMap{{kIp, name}}; }),
        rc::gen::map(real, [](std::string name) { return NameMap{{"10.0.0.1", name}}; }));
}

} // namespace

TEST_CASE("Property: the highest ranked real name wins", "[property][names]") {
    REQUIRE(rc::check("merge_name returns the first non-identity entry",
        [] {
            auto ranked = *rc::gen::container<std::vector<NameMap>>(name_map_gen());
            auto swept = *rc::gen::elementOf(std::vector<std::optional<std::string>>{
                std::nullopt, "swept-host", kIp, ""});

            std::optional<std::string> expected;
            for (const auto& names : ranked) {
                auto it = names.find(kIp);
                if (it != names.end() && !is_identity_name(it->second, kIp)) {
                    expected = it->second;
                    break;
                }
            }
            if (!expected && swept && !is_identity_name(*swept, kIp)) {
                expected = swept;
            }

            RC_ASSERT(merge_name(kIp, ranked, swept) == expected);
        }
    ));
}

TEST_CASE("Property: merged names are never identity names", "[property][names]") {
    REQUIRE(rc::check("no result is empty, the ip, or synthesized",
        [] {
            auto ranked = *rc::gen::container<std::vector<NameMap>>(name_map_gen());
            auto merged = merge_name(kIp, ranked, std::nullopt);
            if (merged) {
                RC_ASSERT(!is_identity_name(*merged, kIp));
            }
        }
    ));
}

TEST_CASE("Property: appending lower ranked resolvers keeps the winner", "[property][names]") {
    REQUIRE(rc::check("a resolved name is stable under extra fallbacks",
        [] {
            auto ranked = *rc::gen::container<std::vector<NameMap>>(name_map_gen());
            auto extra = *rc::gen::container<std::vector<NameMap>>(name_map_gen());
            auto before = merge_name(kIp, ranked, std::nullopt);
            RC_PRE(before.has_value());

            auto extended = ranked;
            extended.insert(extended.end(), extra.begin(), extra.end());
            RC_ASSERT(merge_name(kIp, extended, std::nullopt) == before);
        }
    ));
}
