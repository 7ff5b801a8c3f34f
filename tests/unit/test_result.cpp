#include <catch2/catch_test_macros.hpp>
#include "monadic/core/result.hpp"
#include <string>
using namespace monadic;
TEST_CASE("Result<T, E> - Basic Operations", "[result][core]") {
    SECTION("Ok construction and queries") {
        auto result = Result<int, std::string>::Ok(42);
        REQUIRE(result.IsOk());
        REQUIRE_FALSE(result.IsErr());
        REQUIRE(result.Unwrap() == 42);
    }
    SECTION("Err construction and queries") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE(result.IsErr());
        REQUIRE_FALSE(result.IsOk());
        REQUIRE(result.UnwrapErr() == "error");
    }
    SECTION("Same type on both sides keeps the tag") {
        auto ok = Result<std::string, std::string>::Ok("value");
        auto err = Result<std::string, std::string>::Err("value");
        REQUIRE(ok.IsOk());
        REQUIRE(err.IsErr());
    }
    SECTION("Unit type for void results") {
        auto result = Result<Unit, std::string>::Ok(unit);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == unit);
    }
}
TEST_CASE("Result<T, E> - Wrong side access", "[result][core]") {
    SECTION("Unwrap on Err throws StateError") {
        auto result = Result<int, std::string>::Err("error");
        REQUIRE_THROWS_AS(result.Unwrap(), StateError);
    }
    SECTION("UnwrapErr on Ok throws StateError") {
        auto result = Result<int, std::string>::Ok(1);
        REQUIRE_THROWS_AS(result.UnwrapErr(), StateError);
    }
}
TEST_CASE("Capture - invocation outcome", "[result][capture]") {
    SECTION("Return value becomes Ok") {
        auto result = Capture("test", [](int a, int b) { return a + b; }, 2, 3);
        REQUIRE(result.IsOk());
        REQUIRE(result.Unwrap() == 5);
    }
    SECTION("Void function becomes Ok(Unit)") {
        int calls = 0;
        auto result = Capture("test", [&calls]() { ++calls; });
        REQUIRE(result.IsOk());
        REQUIRE(calls == 1);
    }
    SECTION("std::exception is kept as the original exception") {
        auto result = Capture("test", []() -> int { throw std::invalid_argument("bad"); });
        REQUIRE(result.IsErr());
        REQUIRE_THROWS_AS(std::rethrow_exception(result.UnwrapErr()), std::invalid_argument);
        REQUIRE(DescribeError(result.UnwrapErr()) == "bad");
    }
    SECTION("Non-standard throw is normalized into Error") {
        auto result = Capture("test", []() -> int { throw 7; });
        REQUIRE(result.IsErr());
        REQUIRE_THROWS_AS(std::rethrow_exception(result.UnwrapErr()), Error);
        REQUIRE(DescribeError(result.UnwrapErr()) == "An unknown error was thrown, error = 7");
    }
}
