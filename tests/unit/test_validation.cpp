#include <catch2/catch_test_macros.hpp>
#include "monadic/functional/validation.hpp"
#include "monadic/functional/validation_error.hpp"
#include <functional>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

using namespace monadic;

namespace {

using V = Validation<std::string, int>;
using Errors = std::vector<std::string>;

auto Concat() {
    return [](const Errors& a, const Errors& b) {
        Errors merged = a;
        merged.insert(merged.end(), b.begin(), b.end());
        return merged;
    };
}

auto Sum() {
    return [](const int& a, const int& b) { return a + b; };
}

}

TEST_CASE("Validation - Construction and access", "[validation][functional]") {
    SECTION("Valid") {
        auto v = V::Valid(5);
        REQUIRE(v.IsValid());
        REQUIRE(v.Get() == 5);
        REQUIRE_THROWS_AS(v.GetErrors(), StateError);
    }

    SECTION("Empty Valid") {
        auto v = V::Valid();
        REQUIRE(v.IsValid());
        REQUIRE(v.IsEmpty());
        REQUIRE_THROWS_AS(v.Get(), StateError);
    }

    SECTION("Valid of a null pointer is the empty Valid") {
        using P = Validation<std::string, std::shared_ptr<int>>;
        auto null_valid = P::Valid(nullptr);
        REQUIRE(null_valid.IsValid());
        REQUIRE_FALSE(null_valid.HasValue());
        REQUIRE(null_valid.IsEmpty() == P::Valid().IsEmpty());
        REQUIRE(null_valid.ToOptional().IsEmpty());
        REQUIRE_THROWS_AS(null_valid.Get(), StateError);
    }

    SECTION("Invalid") {
        auto v = V::Invalid(Errors{"A", "B"});
        REQUIRE(v.IsInvalid());
        REQUIRE(v.IsEmpty());
        REQUIRE(v.GetErrors() == Errors{"A", "B"});
        REQUIRE_THROWS_AS(v.Get(), StateError);
    }

    SECTION("Missing errors become an empty sequence") {
        auto v = V::Invalid(std::nullopt);
        REQUIRE(v.IsInvalid());
        REQUIRE(v.GetErrors().empty());
    }
}

TEST_CASE("Validation - Combine", "[validation][functional]") {
    SECTION("Empty input gives an empty Valid") {
        std::vector<V> validations;
        auto combined = V::Combine(validations);
        REQUIRE(combined.IsValid());
        REQUIRE_FALSE(combined.HasValue());
    }

    SECTION("All Valid gives the last Valid") {
        std::vector<V> validations{V::Valid(1), V::Valid(2), V::Valid(3)};
        REQUIRE(V::Combine(validations).Get() == 3);
    }

    SECTION("Errors of every Invalid are concatenated in order") {
        std::vector<V> validations{V::Valid(2), V::Invalid(Errors{"A"}), V::Invalid(Errors{"B"})};
        auto combined = V::Combine(validations);
        REQUIRE(combined.IsInvalid());
        REQUIRE(combined.GetErrors() == Errors{"A", "B"});
    }
}

TEST_CASE("Validation - CombineGetFirstInvalid", "[validation][functional]") {
    SECTION("Stops at the first Invalid") {
        int third_calls = 0;
        std::vector<V::Supplier> suppliers{
            [] { return V::Valid(12); },
            [] { return V::Invalid(Errors{"A"}); },
            [&third_calls] { ++third_calls; return V::Invalid(Errors{"B"}); },
        };
        auto combined = V::CombineGetFirstInvalid(suppliers);
        REQUIRE(combined.GetErrors() == Errors{"A"});
        REQUIRE(third_calls == 0);
    }

    SECTION("All Valid gives the last evaluated Valid") {
        std::vector<V::Supplier> suppliers{
            [] { return V::Valid(1); },
            [] { return V::Valid(2); },
        };
        REQUIRE(V::CombineGetFirstInvalid(suppliers).Get() == 2);
    }

    SECTION("Empty supplier throws ArgumentError") {
        std::vector<V::Supplier> suppliers{[] { return V::Valid(1); }, V::Supplier()};
        REQUIRE_THROWS_AS(V::CombineGetFirstInvalid(suppliers), ArgumentError);
    }
}

TEST_CASE("Validation - Default Ap", "[validation][functional]") {
    REQUIRE(V::Valid(1).Ap(V::Valid(2)).Get() == 2);
    REQUIRE(V::Valid(1).Ap(V::Invalid(Errors{"B"})).GetErrors() == Errors{"B"});
    REQUIRE(V::Invalid(Errors{"A"}).Ap(V::Valid(2)).GetErrors() == Errors{"A"});
    REQUIRE(V::Invalid(Errors{"A"}).Ap(V::Invalid(Errors{"B"})).GetErrors() == Errors{"A", "B"});
    REQUIRE(V::Valid(1).Ap(std::optional<V>()).Get() == 1);
}

TEST_CASE("Validation - Ap with mappers", "[validation][functional]") {
    SECTION("Valid + Valid merges with mapper_success") {
        REQUIRE(V::Valid(2).Ap(V::Valid(3), Concat(), Sum()).Get() == 5);
    }

    SECTION("Valid + Invalid yields other's errors") {
        bool called = false;
        auto merged = V::Valid(2).Ap(
            V::Invalid(Errors{"B"}),
            Concat(),
            [&called](const int& a, const int&) { called = true; return a; });
        REQUIRE(merged.GetErrors() == Errors{"B"});
        REQUIRE_FALSE(called);
    }

    SECTION("Invalid + Valid yields this errors") {
        REQUIRE(V::Invalid(Errors{"A"}).Ap(V::Valid(3), Concat(), Sum()).GetErrors() == Errors{"A"});
    }

    SECTION("Invalid + Invalid merges with mapper_failure") {
        auto reversed = [](const Errors& a, const Errors& b) {
            Errors merged = b;
            merged.insert(merged.end(), a.begin(), a.end());
            return merged;
        };
        auto merged = V::Invalid(Errors{"A"}).Ap(V::Invalid(Errors{"B"}), reversed, Sum());
        REQUIRE(merged.GetErrors() == Errors{"B", "A"});
    }

    SECTION("Empty Valid on either side stays Valid") {
        bool called = false;
        auto counting_sum = [&called](const int& a, const int& b) { called = true; return a + b; };
        auto left_empty = V::Valid().Ap(V::Valid(3), Concat(), counting_sum);
        auto right_empty = V::Valid(2).Ap(V::Valid(), Concat(), counting_sum);
        REQUIRE(left_empty.IsValid());
        REQUIRE(left_empty.IsEmpty());
        REQUIRE(right_empty.IsValid());
        REQUIRE(right_empty.IsEmpty());
        REQUIRE_FALSE(called);
    }

    SECTION("Throwing mapper is captured when E is built from a string") {
        auto merged = V::Valid(2).Ap(
            V::Valid(3),
            Concat(),
            [](const int&, const int&) -> int { throw std::runtime_error("merge failed"); });
        REQUIRE(merged.GetErrors() == Errors{"merge failed"});
    }

    SECTION("Throwing mapper is captured as exception_ptr") {
        using P = Validation<std::exception_ptr, int>;
        auto merged = P::Valid(2).Ap(
            P::Valid(3),
            [](const P::Errors& a, const P::Errors&) { return a; },
            [](const int&, const int&) -> int { throw std::runtime_error("merge failed"); });
        REQUIRE(merged.GetErrors().size() == 1);
        REQUIRE(DescribeError(merged.GetErrors().front()) == "merge failed");
    }

    SECTION("Throwing mapper propagates when E cannot hold it") {
        using P = Validation<ValidationError, int>;
        REQUIRE_THROWS_AS(
            P::Valid(2).Ap(
                P::Valid(3),
                [](const P::Errors& a, const P::Errors&) { return a; },
                [](const int&, const int&) -> int { throw std::runtime_error("merge failed"); }),
            std::runtime_error);
    }

    SECTION("Absent other returns this") {
        REQUIRE(V::Valid(2).Ap(std::optional<V>(), Concat(), Sum()).Get() == 2);
    }
}

TEST_CASE("Validation - Filter", "[validation][functional]") {
    auto positive = [](const int& v) { return v > 0; };

    SECTION("Filter") {
        REQUIRE(V::Valid(1).Filter(positive).has_value());
        REQUIRE_FALSE(V::Valid(-1).Filter(positive).has_value());
        REQUIRE(V::Valid(-1).Filter(std::function<bool(const int&)>()).has_value());

        bool evaluated = false;
        auto invalid = V::Invalid(Errors{"A"}).Filter([&evaluated](const int&) { evaluated = true; return false; });
        REQUIRE(invalid.has_value());
        REQUIRE(invalid->GetErrors() == Errors{"A"});
        REQUIRE_FALSE(evaluated);
    }

    SECTION("FilterOptional") {
        REQUIRE(V::Valid(1).FilterOptional(positive).IsPresent());
        REQUIRE(V::Valid(-1).FilterOptional(positive).IsEmpty());
    }

    SECTION("FilterOrElse") {
        auto describe = [](const int& v) { return "not positive: " + std::to_string(v); };
        REQUIRE(V::Valid(1).FilterOrElse(positive, describe).Get() == 1);
        REQUIRE(V::Valid(-2).FilterOrElse(positive, describe).GetErrors() == Errors{"not positive: -2"});
        REQUIRE_THROWS_AS(
            V::Valid(-2).FilterOrElse(positive, std::function<std::string(const int&)>()),
            ArgumentError);
        REQUIRE(V::Invalid(Errors{"A"}).FilterOrElse(positive, describe).GetErrors() == Errors{"A"});
    }
}

TEST_CASE("Validation - Transformations", "[validation][functional]") {
    SECTION("Map") {
        REQUIRE(V::Valid(2).Map([](const int& v) { return v * 3; }).Get() == 6);
        REQUIRE(V::Invalid(Errors{"A"}).Map([](const int& v) { return v * 3; }).GetErrors() == Errors{"A"});
        REQUIRE(V::Valid().Map([](const int& v) { return v * 3; }).IsEmpty());
    }

    SECTION("MapInvalid") {
        auto counted = V::Invalid(Errors{"A", "B"}).MapInvalid([](const Errors& errors) {
            return std::vector<std::size_t>{errors.size()};
        });
        REQUIRE(counted.GetErrors() == std::vector<std::size_t>{2});
        REQUIRE(V::Valid(1).MapInvalid([](const Errors& errors) { return errors; }).Get() == 1);
    }

    SECTION("FlatMap") {
        auto check = [](const int& v) { return v > 10 ? V::Valid(v) : V::Invalid(Errors{"small"}); };
        REQUIRE(V::Valid(20).FlatMap(check).Get() == 20);
        REQUIRE(V::Valid(1).FlatMap(check).GetErrors() == Errors{"small"});
        REQUIRE(V::Invalid(Errors{"A"}).FlatMap(check).GetErrors() == Errors{"A"});
    }

    SECTION("Fold") {
        auto on_invalid = [](const Errors& errors) { return errors.size(); };
        auto on_valid = [](const int&) { return std::size_t{0}; };
        REQUIRE(V::Valid(1).Fold(on_invalid, on_valid) == 0u);
        REQUIRE(V::Invalid(Errors{"A", "B"}).Fold(on_invalid, on_valid) == 2u);
    }
}

TEST_CASE("Validation - Conversions", "[validation][functional]") {
    SECTION("FromTry then ToEither keeps the value") {
        using P = Validation<std::exception_ptr, int>;
        REQUIRE(P::FromTry(Try<int>::Success(9)).ToEither().Get() == 9);

        auto error = std::make_exception_ptr(std::runtime_error("x"));
        REQUIRE(P::FromTry(Try<int>::Failure(error)).GetErrors() == P::Errors{error});
        REQUIRE(P::FromTry(std::optional<Try<int>>()).GetErrors().empty());
    }

    SECTION("FromEither") {
        REQUIRE(V::FromEither(Either<std::string, int>::Left("e")).GetErrors() == Errors{"e"});
        REQUIRE(V::FromEither(Either<std::string, int>::Right(4)).Get() == 4);
        REQUIRE(V::FromEither(std::optional<Either<std::string, int>>()).GetErrors().empty());
    }

    SECTION("FromEither drops a null left") {
        using P = Validation<std::shared_ptr<int>, int>;
        auto v = P::FromEither(Either<std::shared_ptr<int>, int>::Left(nullptr));
        REQUIRE(v.IsInvalid());
        REQUIRE(v.GetErrors().empty());
    }

    SECTION("ToEither") {
        REQUIRE(V::Invalid(Errors{"A"}).ToEither().GetLeft() == Errors{"A"});
        REQUIRE(V::Valid(3).ToEither().Get() == 3);
    }

    SECTION("ToOptional") {
        REQUIRE(V::Valid(3).ToOptional().Get() == 3);
        REQUIRE(V::Invalid(Errors{"A"}).ToOptional().IsEmpty());
    }
}
