#include <catch2/catch_test_macros.hpp>
#include "monadic/core/failures.hpp"
#include "monadic/core/format.hpp"
#include <string>

using namespace monadic;

TEST_CASE("Failures - Error taxonomy", "[failures][core]") {
    SECTION("Error is Generic") {
        Error error("boom");
        REQUIRE(error.Type() == FailureType::Generic);
        REQUIRE(std::string(error.what()) == "boom");
    }

    SECTION("ArgumentError is an IllegalArgument Error") {
        ArgumentError error("missing");
        REQUIRE(error.Type() == FailureType::IllegalArgument);
        const Error& base = error;
        REQUIRE(std::string(base.what()) == "missing");
    }

    SECTION("StateError is an IllegalState Error") {
        StateError error("wrong variant");
        REQUIRE(error.Type() == FailureType::IllegalState);
    }

    SECTION("FailureTypeToString names every type") {
        REQUIRE(std::string(FailureTypeToString(FailureType::Generic)) == "Generic");
        REQUIRE(std::string(FailureTypeToString(FailureType::IllegalArgument)) == "IllegalArgument");
        REQUIRE(std::string(FailureTypeToString(FailureType::IllegalState)) == "IllegalState");
    }
}

TEST_CASE("Failures - DescribeError", "[failures][core]") {
    SECTION("std::exception uses what()") {
        auto error = std::make_exception_ptr(std::runtime_error("disk full"));
        REQUIRE(DescribeError(error) == "disk full");
    }

    SECTION("Null pointer has a placeholder") {
        REQUIRE(DescribeError(std::exception_ptr()) == "<null error>");
    }

    SECTION("String literals and strings are described verbatim") {
        REQUIRE(DescribeError(std::make_exception_ptr("text")) == "text");
        REQUIRE(DescribeError(std::make_exception_ptr(std::string("owned"))) == "owned");
    }

    SECTION("Unknown types get the unknown placeholder") {
        struct Opaque {};
        REQUIRE(DescribeError(std::make_exception_ptr(Opaque{})) == "<unknown>");
    }
}

TEST_CASE("Failures - NormalizeUnknownError", "[failures][core]") {
    SECTION("std::exception passes through untouched") {
        auto error = std::make_exception_ptr(std::logic_error("logic"));
        REQUIRE(NormalizeUnknownError(error) == error);
    }

    SECTION("Other values are wrapped into Error") {
        auto normalized = NormalizeUnknownError(std::make_exception_ptr(42));
        REQUIRE_THROWS_AS(std::rethrow_exception(normalized), Error);
        REQUIRE(DescribeError(normalized) == "An unknown error was thrown, error = 42");
    }

    SECTION("Null pointer becomes an ArgumentError") {
        auto normalized = NormalizeUnknownError(std::exception_ptr());
        REQUIRE_THROWS_AS(std::rethrow_exception(normalized), ArgumentError);
    }
}

TEST_CASE("Format - FormatBounded", "[format][core]") {
    SECTION("Short text is untouched") {
        REQUIRE(compat::FormatBounded(32, "{}-{}", "a", 1) == "a-1");
    }

    SECTION("Long text is cut with an ellipsis") {
        auto text = compat::FormatBounded(8, "{}", std::string("abcdefghijkl"));
        REQUIRE(text == "abcde...");
        REQUIRE(text.size() == 8);
    }

    SECTION("Tiny limits cut without an ellipsis") {
        REQUIRE(compat::FormatBounded(2, "{}", "abcdef") == "ab");
    }
}
