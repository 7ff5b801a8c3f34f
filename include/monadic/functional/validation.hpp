#pragma once
#include "monadic/core/constants.hpp"
#include "monadic/core/failures.hpp"
#include "monadic/core/nullability.hpp"
#include "monadic/core/result.hpp"
#include "monadic/debug/trace_logger.hpp"
#include "monadic/functional/fwd.hpp"
#include "monadic/functional/optional.hpp"
#include <exception>
#include <functional>
#include <iterator>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
namespace monadic {
namespace detail {
/// Error sequence standing for an exception captured inside a Validation
/// combinator, or std::nullopt when E cannot represent it.
template<typename E>
[[nodiscard]] std::optional<std::vector<E>> ErrorsFromException(const std::exception_ptr& error) {
    if constexpr (std::is_same_v<E, std::exception_ptr>) {
        return std::vector<E>{error};
    } else if constexpr (std::is_constructible_v<E, std::string>) {
        return std::vector<E>{E(DescribeError(error))};
    } else {
        return std::nullopt;
    }
}
}

/**
 * @brief Either a Valid value or an Invalid, ordered sequence of errors.
 *
 * Valid may be empty (Valid()), which stands for "valid, no payload".
 * Valid(value) with a null value is the same empty Valid.
 * Invalid always owns a sequence; a missing one becomes an empty sequence.
 *
 * Two ways to merge several validations:
 * - Combine: eager. Every Invalid contributes its errors, in input order.
 * - CombineGetFirstInvalid: lazy. Suppliers run in order and the first
 *   Invalid stops the evaluation.
 */
template<typename E, typename T>
class Validation {
private:
    std::variant<std::optional<T>, std::vector<E>> value_;
public:
    using error_type = E;
    using value_type = T;
    using Errors = std::vector<E>;
    using Supplier = std::function<Validation()>;

    [[nodiscard]] static Validation Valid(T value) {
        if (IsNull(value)) {
            return Valid();
        }
        return Validation(std::in_place_index<0>, std::optional<T>(std::move(value)));
    }
    [[nodiscard]] static Validation Valid() {
        return Validation(std::in_place_index<0>, std::optional<T>());
    }
    [[nodiscard]] static Validation Invalid(Errors errors) {
        return Validation(std::in_place_index<1>, std::move(errors));
    }
    /// Missing errors are normalized to an empty sequence.
    [[nodiscard]] static Validation Invalid(std::nullopt_t) {
        return Validation(std::in_place_index<1>, Errors{});
    }

    /**
     * @brief Eager left fold over validations.
     *
     * @return An empty Valid for an empty input. If every element is Valid,
     *         the last one. Otherwise an Invalid with the errors of every
     *         Invalid element concatenated in input order.
     */
    [[nodiscard]] static Validation Combine(std::span<const Validation> validations) {
        Validation result = Valid();
        for (const auto& validation : validations) {
            result = result.Ap(validation);
        }
        return result;
    }

    /**
     * @brief Runs suppliers in order and stops at the first Invalid.
     *
     * Suppliers after the first Invalid are never invoked. An empty
     * supplier throws ArgumentError when it is reached.
     *
     * @return An empty Valid for an empty input, the first Invalid, or the
     *         last evaluated Valid.
     */
    [[nodiscard]] static Validation CombineGetFirstInvalid(std::span<const Supplier> suppliers) {
        Validation result = Valid();
        for (std::size_t i = 0; i < suppliers.size(); ++i) {
            AssertNotNull(suppliers[i], ErrorMessages::SUPPLIER_NOT_NULL);
            result = result.Ap(suppliers[i]());
            if (!result.IsValid()) {
                if (i + 1 < suppliers.size()) {
                    debug::LogShortCircuit("Validation::CombineGetFirstInvalid", i, suppliers.size());
                }
                return result;
            }
        }
        return result;
    }

    /// Right gives Valid with the same payload, Left gives Invalid({left}).
    [[nodiscard]] static Validation FromEither(const Either<E, T>& either) {
        if (either.IsRight()) {
            return either.HasValue() ? Valid(either.Get()) : Valid();
        }
        if (IsNull(either.GetLeft())) {
            return Invalid(std::nullopt);
        }
        return Invalid(Errors{either.GetLeft()});
    }
    [[nodiscard]] static Validation FromEither(const std::optional<Either<E, T>>& either) {
        if (!either.has_value()) {
            return Invalid(std::nullopt);
        }
        return FromEither(*either);
    }

    /// Success gives Valid with the same payload, Failure gives Invalid({error}).
    [[nodiscard]] static Validation FromTry(const Try<T>& t) {
        static_assert(std::is_same_v<E, std::exception_ptr>,
                      "FromTry produces a Validation of std::exception_ptr errors");
        if (t.IsSuccess()) {
            return t.HasValue() ? Valid(t.Get()) : Valid();
        }
        return Invalid(Errors{t.GetError()});
    }
    [[nodiscard]] static Validation FromTry(const std::optional<Try<T>>& t) {
        if (!t.has_value()) {
            return Invalid(std::nullopt);
        }
        return FromTry(*t);
    }

    [[nodiscard]] bool IsValid() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsInvalid() const noexcept { return value_.index() == 1; }
    [[nodiscard]] bool HasValue() const noexcept {
        return IsValid() && std::get<0>(value_).has_value();
    }
    [[nodiscard]] bool IsEmpty() const noexcept {
        return !HasValue();
    }

    [[nodiscard]] const T& Get() const {
        if (IsInvalid()) {
            throw StateError(std::string(ErrorMessages::INVALID_HAS_NO_VALUE));
        }
        const auto& payload = std::get<0>(value_);
        if (!payload.has_value()) {
            throw StateError(std::string(ErrorMessages::EMPTY_VALID));
        }
        return *payload;
    }

    [[nodiscard]] const Errors& GetErrors() const {
        if (IsValid()) {
            throw StateError(std::string(ErrorMessages::VALID_HAS_NO_ERRORS));
        }
        return std::get<1>(value_);
    }

    /// Valid + Valid keeps other's payload, one Invalid wins, two Invalid
    /// concatenate their errors (this first).
    [[nodiscard]] Validation Ap(const Validation& other) const {
        if (IsValid()) {
            return other;
        }
        if (other.IsValid()) {
            return *this;
        }
        Errors errors = GetErrors();
        const auto& other_errors = other.GetErrors();
        errors.insert(errors.end(), other_errors.begin(), other_errors.end());
        return Invalid(std::move(errors));
    }

    [[nodiscard]] Validation Ap(const std::optional<Validation>& other) const {
        if (!other.has_value()) {
            return *this;
        }
        return Ap(*other);
    }

    /// Same matrix as Try::Ap. Both mappers run under Capture; a throw turns
    /// into a single-error Invalid when E can hold it, else it propagates.
    /// An empty Valid on either side gives an empty Valid.
    template<typename FFailure, typename FSuccess>
    [[nodiscard]] Validation Ap(const Validation& other, FFailure&& mapper_failure, FSuccess&& mapper_success) const {
        if (IsValid()) {
            if (other.IsValid()) {
                if (!HasValue() || !other.HasValue()) {
                    return Valid();
                }
                auto outcome = Capture("Validation::Ap", [this, &other, &mapper_success]() -> T {
                    return std::invoke(mapper_success, Get(), other.Get());
                });
                if (outcome.IsErr()) {
                    return FromCapturedError(std::move(outcome).UnwrapErr());
                }
                return Valid(std::move(outcome).Unwrap());
            }
            return Invalid(other.GetErrors());
        }
        if (other.IsValid()) {
            return Invalid(GetErrors());
        }
        auto outcome = Capture("Validation::Ap", [this, &other, &mapper_failure]() -> Errors {
            return std::invoke(mapper_failure, GetErrors(), other.GetErrors());
        });
        if (outcome.IsErr()) {
            return FromCapturedError(std::move(outcome).UnwrapErr());
        }
        return Invalid(std::move(outcome).Unwrap());
    }

    template<typename FFailure, typename FSuccess>
    [[nodiscard]] Validation Ap(const std::optional<Validation>& other,
                                FFailure&& mapper_failure,
                                FSuccess&& mapper_success) const {
        if (!other.has_value()) {
            return *this;
        }
        return Ap(*other, std::forward<FFailure>(mapper_failure), std::forward<FSuccess>(mapper_success));
    }

    /// Returns std::nullopt, not an Invalid, when a Valid payload fails predicate.
    template<typename Pred>
    [[nodiscard]] std::optional<Validation> Filter(Pred&& predicate) const {
        if (!HasValue() || IsNull(predicate)) {
            return *this;
        }
        if (std::invoke(std::forward<Pred>(predicate), Get())) {
            return *this;
        }
        return std::nullopt;
    }

    template<typename Pred>
    [[nodiscard]] Optional<Validation> FilterOptional(Pred&& predicate) const {
        return Optional<Validation>::OfNullable(Filter(std::forward<Pred>(predicate)));
    }

    template<typename Pred, typename F>
    [[nodiscard]] Validation FilterOrElse(Pred&& predicate, F&& error_mapper) const {
        if (!HasValue() || IsNull(predicate)) {
            return *this;
        }
        if (std::invoke(std::forward<Pred>(predicate), Get())) {
            return *this;
        }
        AssertNotNull(error_mapper, ErrorMessages::ERROR_MAPPER_NOT_NULL);
        return Invalid(Errors{std::invoke(std::forward<F>(error_mapper), Get())});
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& mapper) const -> Validation<E, std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (IsInvalid()) {
            return Validation<E, U>::Invalid(GetErrors());
        }
        if (!HasValue()) {
            return Validation<E, U>::Valid();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return Validation<E, U>::Valid(std::invoke(std::forward<F>(mapper), Get()));
    }

    /// Transforms the whole error sequence of an Invalid.
    template<typename F>
    [[nodiscard]] auto MapInvalid(F&& mapper) const
        -> Validation<typename std::decay_t<std::invoke_result_t<F, const Errors&>>::value_type, T> {
        using NewErrors = std::decay_t<std::invoke_result_t<F, const Errors&>>;
        using ResultType = Validation<typename NewErrors::value_type, T>;
        if (IsValid()) {
            return HasValue() ? ResultType::Valid(Get()) : ResultType::Valid();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return ResultType::Invalid(std::invoke(std::forward<F>(mapper), GetErrors()));
    }

    template<typename F>
    [[nodiscard]] auto FlatMap(F&& mapper) const -> std::decay_t<std::invoke_result_t<F, const T&>> {
        using ResultType = std::decay_t<std::invoke_result_t<F, const T&>>;
        static_assert(IsValidation<ResultType>::value, "FlatMap function must return a Validation");
        if (IsInvalid()) {
            return ResultType::Invalid(GetErrors());
        }
        if (!HasValue()) {
            return ResultType::Valid();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return std::invoke(std::forward<F>(mapper), Get());
    }

    template<typename FInvalid, typename FValid>
    auto Fold(FInvalid&& on_invalid, FValid&& on_valid) const -> std::invoke_result_t<FValid, const T&> {
        if (IsValid()) {
            return std::invoke(std::forward<FValid>(on_valid), Get());
        }
        return std::invoke(std::forward<FInvalid>(on_invalid), GetErrors());
    }

    [[nodiscard]] Either<Errors, T> ToEither() const {
        using EitherType = Either<Errors, T>;
        if (IsInvalid()) {
            return EitherType::Left(GetErrors());
        }
        return HasValue() ? EitherType::Right(Get()) : EitherType::Right();
    }

    [[nodiscard]] Optional<T> ToOptional() const {
        return IsEmpty() ? Optional<T>::Empty() : Optional<T>::Of(Get());
    }

private:
    template<std::size_t I, typename... Args>
    explicit Validation(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    static Validation FromCapturedError(std::exception_ptr error) {
        auto errors = detail::ErrorsFromException<E>(error);
        if (!errors.has_value()) {
            std::rethrow_exception(error);
        }
        return Invalid(std::move(*errors));
    }
};

}

#include "monadic/functional/either.hpp"
#include "monadic/functional/try.hpp"
