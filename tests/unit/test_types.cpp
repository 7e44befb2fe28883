#include <catch2/catch_test_macros.hpp>
#include "core/types.hpp"

#include <unordered_set>

using namespace lantern;

TEST_CASE("Uuid generate and parse", "[types]") {
    auto id = Uuid::generate();
    REQUIRE_FALSE(id.is_nil());

    auto text = id.to_string();
    REQUIRE(text.size() == 36);
    REQUIRE(text[14] == '4');

    auto parsed = Uuid::parse(text);
    REQUIRE(parsed.has_value());
    REQUIRE(*parsed == id);

    SECTION("Bare hex form is accepted") {
        std::string bare;
        for (char c : text) {
            if (c != '-') bare += c;
        }
        REQUIRE(Uuid::parse(bare) == id);
    }

    SECTION("Malformed input is rejected") {
        REQUIRE_FALSE(Uuid::parse("").has_value());
        REQUIRE_FALSE(Uuid::parse("not-a-uuid").has_value());
        REQUIRE_FALSE(Uuid::parse("zzzzzzzz-zzzz-zzzz-zzzz-zzzzzzzzzzzz").has_value());
    }
}

TEST_CASE("Uuid values are distinct and hashable", "[types]") {
    std::unordered_set<Uuid> ids;
    for (int i = 0; i < 100; ++i) {
        ids.insert(Uuid::generate());
    }
    REQUIRE(ids.size() == 100);
    REQUIRE(Uuid{}.is_nil());
}

TEST_CASE("Timestamp arithmetic and formatting", "[types]") {
    Timestamp epoch(0);
    REQUIRE(epoch.to_iso_string() == "1970-01-01T00:00:00.000Z");
    REQUIRE(Timestamp(1234).to_iso_string() == "1970-01-01T00:00:01.234Z");

    auto later = epoch + std::chrono::milliseconds(1500);
    REQUIRE(later.millis() == 1500);
    REQUIRE(later > epoch);
    REQUIRE((later - epoch) == std::chrono::milliseconds(1500));
    REQUIRE((later - std::chrono::milliseconds(500)).millis() == 1000);

    auto now = Timestamp::now();
    REQUIRE(now.millis() > 1600000000000);
}
