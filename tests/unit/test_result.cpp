#include <catch2/catch_test_macros.hpp>
#include "core/result.hpp"

#include <stdexcept>

using namespace lantern;

TEST_CASE("Result::ok creates a success result", "[result]") {
    auto result = Result<int>::ok(42);

    REQUIRE(result.is_ok());
    REQUIRE_FALSE(result.is_err());
    REQUIRE(result.unwrap() == 42);
}

TEST_CASE("Result::err carries the library status code", "[result]") {
    auto result = Result<int>::err(Error{"database is locked", 5});

    REQUIRE(result.is_err());
    REQUIRE(result.unwrap_err().message == "database is locked");
    REQUIRE(result.unwrap_err().code == 5);
}

TEST_CASE("Result::unwrap throws on error", "[result]") {
    auto result = Result<int>::err(Error{"error"});

    REQUIRE_THROWS_AS(result.unwrap(), std::runtime_error);
    REQUIRE_THROWS_AS(Result<int>::ok(1).unwrap_err(), std::runtime_error);
}

TEST_CASE("Result::value_or returns default on error", "[result]") {
    REQUIRE(Result<int>::ok(42).value_or(0) == 42);
    REQUIRE(Result<int>::err(Error{"error"}).value_or(0) == 0);
}

TEST_CASE("Status works correctly", "[result]") {
    auto ok_result = Status::ok();
    auto err_result = Status::err(Error{"error"});

    REQUIRE(ok_result.is_ok());
    REQUIRE(err_result.is_err());

    REQUIRE_NOTHROW(ok_result.unwrap());
    REQUIRE_THROWS(err_result.unwrap());
    REQUIRE(err_result.unwrap_err().message == "error");
}
