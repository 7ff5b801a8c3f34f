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
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>
namespace monadic {

/// Outcome of a computation that may throw.
///
/// Success holds an optional payload. Success() is the one "empty" success;
/// Success(value) with a null value collapses to it. An empty Success is
/// still a Success: combinators keep it on the success side. Failure always
/// holds a non-null std::exception_ptr, the original exception.
///
/// Every combinator that runs a user callback does so through Capture(),
/// so a throwing callback turns into a Failure instead of escaping.
template<typename T>
class Try {
private:
    std::variant<std::optional<T>, std::exception_ptr> value_;
public:
    using value_type = T;
    using Supplier = std::function<Try()>;

    Try(const Try&) = default;
    Try(Try&&) noexcept = default;
    Try& operator=(const Try&) = default;
    Try& operator=(Try&&) noexcept = default;
    ~Try() = default;

    [[nodiscard]] static Try Success(T value) {
        if (IsNull(value)) {
            return Success();
        }
        return Try(std::in_place_index<0>, std::optional<T>(std::move(value)));
    }
    [[nodiscard]] static Try Success() {
        return Try(std::in_place_index<0>, std::optional<T>());
    }
    [[nodiscard]] static Try Failure(std::exception_ptr error) {
        AssertNotNull(error, ErrorMessages::ERROR_NOT_NULL);
        return Try(std::in_place_index<1>, std::move(error));
    }
    template<typename X, typename = std::enable_if_t<std::is_base_of_v<std::exception, std::decay_t<X>>>>
    [[nodiscard]] static Try Failure(X&& error) {
        return Failure(std::make_exception_ptr(std::forward<X>(error)));
    }

    /// Runs func(args...) inside a protected region. Any arity is accepted;
    /// the result must convert to T (Unit for void functions).
    template<typename F, typename... Args>
    [[nodiscard]] static Try OfFunction(F&& func, Args&&... args) {
        return FromResult(Capture("Try::OfFunction", std::forward<F>(func), std::forward<Args>(args)...));
    }

    /// Left fold of Ap over tries. An empty sequence gives an empty Success.
    template<typename FFailure, typename FSuccess>
    [[nodiscard]] static Try Combine(FFailure&& mapper_failure, FSuccess&& mapper_success, std::span<const Try> tries) {
        if (tries.empty()) {
            return Success();
        }
        Try result = tries.front();
        for (std::size_t i = 1; i < tries.size(); ++i) {
            result = result.Ap(tries[i], mapper_failure, mapper_success);
        }
        return result;
    }

    /// Evaluates suppliers in order and stops at the first Failure; later
    /// suppliers are never invoked. Successes are merged with mapper_success.
    template<typename FSuccess>
    [[nodiscard]] static Try CombineGetFirstFailure(FSuccess&& mapper_success, std::span<const Supplier> suppliers) {
        if (suppliers.empty()) {
            return Success();
        }
        Try result = RunSupplier(suppliers.front());
        for (std::size_t i = 1; i < suppliers.size(); ++i) {
            if (result.IsFailure()) {
                debug::LogShortCircuit("Try::CombineGetFirstFailure", i - 1, suppliers.size());
                return result;
            }
            result = result.Ap(
                RunSupplier(suppliers[i]),
                [](const std::exception_ptr& first, const std::exception_ptr&) { return first; },
                mapper_success);
        }
        return result;
    }

    [[nodiscard]] bool IsSuccess() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsFailure() const noexcept { return value_.index() == 1; }

    /// True for a Success that carries a payload. A payload is never null.
    [[nodiscard]] bool HasValue() const noexcept {
        return IsSuccess() && std::get<0>(value_).has_value();
    }

    /// True for a Failure or an empty Success.
    [[nodiscard]] bool IsEmpty() const noexcept {
        return !HasValue();
    }

    /// Returns the payload of a Success. A Failure re-raises the stored
    /// exception itself, not a copy. An empty Success throws StateError.
    [[nodiscard]] const T& Get() const {
        if (IsFailure()) {
            std::rethrow_exception(std::get<1>(value_));
        }
        const auto& payload = std::get<0>(value_);
        if (!payload.has_value()) {
            throw StateError(std::string(ErrorMessages::EMPTY_SUCCESS));
        }
        return *payload;
    }

    [[nodiscard]] const std::exception_ptr& GetError() const {
        if (IsSuccess()) {
            throw StateError(std::string(ErrorMessages::SUCCESS_HAS_NO_ERROR));
        }
        return std::get<1>(value_);
    }

    [[nodiscard]] std::string GetErrorMessage() const {
        return DescribeError(GetError());
    }

    /// on_success runs on a Success; if it throws the captured exception is
    /// handed to on_failure instead. An empty Success passes the null value
    /// of T to on_success; when T has no null value it throws StateError,
    /// use the three-callback overload for those.
    template<typename FFailure, typename FSuccess>
    auto Fold(FFailure&& on_failure, FSuccess&& on_success) const
        -> std::decay_t<std::invoke_result_t<FSuccess, const T&>> {
        if (IsFailure()) {
            return std::invoke(std::forward<FFailure>(on_failure), std::get<1>(value_));
        }
        const auto& payload = std::get<0>(value_);
        return FoldSuccess(std::forward<FFailure>(on_failure), std::forward<FSuccess>(on_success),
                           payload.has_value() ? *payload : EmptyPayload());
    }

    /// Like Fold, with on_empty() handling an empty Success.
    template<typename FFailure, typename FEmpty, typename FSuccess>
    auto Fold(FFailure&& on_failure, FEmpty&& on_empty, FSuccess&& on_success) const
        -> std::decay_t<std::invoke_result_t<FSuccess, const T&>> {
        if (IsFailure()) {
            return std::invoke(std::forward<FFailure>(on_failure), std::get<1>(value_));
        }
        if (!HasValue()) {
            auto outcome = Capture("Try::Fold", std::forward<FEmpty>(on_empty));
            return Settle<std::decay_t<std::invoke_result_t<FSuccess, const T&>>>(
                std::move(outcome), std::forward<FFailure>(on_failure));
        }
        return FoldSuccess(std::forward<FFailure>(on_failure), std::forward<FSuccess>(on_success),
                           *std::get<0>(value_));
    }

    /// Four cases:
    /// - Success + Success: Success(mapper_success(a, b)), exception-safe;
    ///   an empty Success on either side gives an empty Success
    ///   without invoking the mapper
    /// - Success + Failure: other's Failure, no mapper invoked
    /// - Failure + Success: this Failure
    /// - Failure + Failure: Failure(mapper_failure(a, b)), exception-safe
    template<typename FFailure, typename FSuccess>
    [[nodiscard]] Try Ap(const Try& other, FFailure&& mapper_failure, FSuccess&& mapper_success) const {
        if (IsSuccess()) {
            if (other.IsSuccess()) {
                if (!HasValue() || !other.HasValue()) {
                    return Success();
                }
                return FromResult(Capture("Try::Ap", [this, &other, &mapper_success]() -> T {
                    return std::invoke(mapper_success, Get(), other.Get());
                }));
            }
            return Failure(other.GetError());
        }
        if (other.IsSuccess()) {
            return Failure(GetError());
        }
        return FromErrorResult(Capture("Try::Ap", [this, &other, &mapper_failure]() -> std::exception_ptr {
            return std::invoke(mapper_failure, GetError(), other.GetError());
        }));
    }

    template<typename FFailure, typename FSuccess>
    [[nodiscard]] Try Ap(const std::optional<Try>& other, FFailure&& mapper_failure, FSuccess&& mapper_success) const {
        if (!other.has_value()) {
            return *this;
        }
        return Ap(*other, std::forward<FFailure>(mapper_failure), std::forward<FSuccess>(mapper_success));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& mapper) const -> Try<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (IsFailure()) {
            return Try<U>::Failure(std::get<1>(value_));
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        if (!HasValue()) {
            return Try<U>::Success();
        }
        return Try<U>::OfFunction([this, &mapper]() -> U {
            return std::invoke(mapper, Get());
        });
    }

    template<typename F>
    [[nodiscard]] Try MapFailure(F&& mapper) const {
        if (IsSuccess()) {
            return *this;
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return FromErrorResult(Capture("Try::MapFailure", std::forward<F>(mapper), std::get<1>(value_)));
    }

    template<typename F>
    [[nodiscard]] Try Recover(F&& mapper) const {
        if (IsSuccess()) {
            return *this;
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return FromResult(Capture("Try::Recover", std::forward<F>(mapper), std::get<1>(value_)));
    }

    template<typename F>
    [[nodiscard]] Try RecoverWith(F&& mapper) const {
        static_assert(std::is_same_v<std::decay_t<std::invoke_result_t<F, const std::exception_ptr&>>, Try>,
                      "RecoverWith function must return a Try of the same type");
        if (IsSuccess()) {
            return *this;
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        auto outcome = Capture("Try::RecoverWith", std::forward<F>(mapper), std::get<1>(value_));
        if (outcome.IsErr()) {
            return Failure(std::move(outcome).UnwrapErr());
        }
        return std::move(outcome).Unwrap();
    }

    template<typename FFailure, typename FSuccess>
    [[nodiscard]] auto Transform(FFailure&& mapper_failure, FSuccess&& mapper_success) const
        -> Try<std::decay_t<std::invoke_result_t<FSuccess, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<FSuccess, const T&>>;
        if (IsSuccess()) {
            return Map(std::forward<FSuccess>(mapper_success));
        }
        AssertNotNull(mapper_failure, ErrorMessages::MAPPER_NOT_NULL);
        return Try<U>::OfFunction(std::forward<FFailure>(mapper_failure), std::get<1>(value_));
    }

    [[nodiscard]] Try OrElse(const Try& other) const {
        return IsSuccess() ? *this : other;
    }

    template<typename F>
    [[nodiscard]] Try OrElseGet(F&& supplier) const {
        if (IsSuccess()) {
            return *this;
        }
        AssertNotNull(supplier, ErrorMessages::SUPPLIER_NOT_NULL);
        auto outcome = Capture("Try::OrElseGet", std::forward<F>(supplier));
        if (outcome.IsErr()) {
            return Failure(std::move(outcome).UnwrapErr());
        }
        return std::move(outcome).Unwrap();
    }

    /// The value of a Success, default_value for a Failure. An empty Success
    /// yields the null value of T, or throws StateError when T has none.
    [[nodiscard]] T GetOrElse(T default_value) const {
        if (IsFailure()) {
            return default_value;
        }
        const auto& payload = std::get<0>(value_);
        return payload.has_value() ? *payload : EmptyPayload();
    }

    /// GetOrElse wrapped in an Optional; an empty Success gives Empty.
    [[nodiscard]] Optional<T> GetOrElseOptional(T default_value) const {
        if (IsSuccess()) {
            return Optional<T>::OfNullable(std::get<0>(value_));
        }
        return Optional<T>::OfNullable(std::move(default_value));
    }

    [[nodiscard]] Optional<T> ToOptional() const {
        return IsEmpty() ? Optional<T>::Empty() : Optional<T>::Of(Get());
    }

    [[nodiscard]] Either<std::exception_ptr, T> ToEither() const {
        using EitherType = Either<std::exception_ptr, T>;
        if (IsFailure()) {
            return EitherType::Left(std::get<1>(value_));
        }
        return HasValue() ? EitherType::Right(Get()) : EitherType::Right();
    }

    [[nodiscard]] Validation<std::exception_ptr, T> ToValidation() const {
        using ValidationType = Validation<std::exception_ptr, T>;
        if (IsFailure()) {
            return ValidationType::Invalid(std::vector<std::exception_ptr>{std::get<1>(value_)});
        }
        return HasValue() ? ValidationType::Valid(Get()) : ValidationType::Valid();
    }

private:
    template<std::size_t I, typename... Args>
    explicit Try(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}

    static T EmptyPayload() {
        if constexpr (IsNullableV<T>) {
            return T{};
        } else {
            throw StateError(std::string(ErrorMessages::EMPTY_SUCCESS));
        }
    }

    template<typename FFailure, typename FSuccess>
    static auto FoldSuccess(FFailure&& on_failure, FSuccess&& on_success, const T& payload)
        -> std::decay_t<std::invoke_result_t<FSuccess, const T&>> {
        auto outcome = Capture("Try::Fold", [&on_success, &payload]() -> decltype(auto) {
            return std::invoke(on_success, payload);
        });
        return Settle<std::decay_t<std::invoke_result_t<FSuccess, const T&>>>(
            std::move(outcome), std::forward<FFailure>(on_failure));
    }

    template<typename U, typename V, typename FFailure>
    static U Settle(Result<V, std::exception_ptr>&& outcome, FFailure&& on_failure) {
        if (outcome.IsErr()) {
            return std::invoke(std::forward<FFailure>(on_failure), std::move(outcome).UnwrapErr());
        }
        if constexpr (!std::is_void_v<U>) {
            return std::move(outcome).Unwrap();
        }
    }

    template<typename U>
    static Try FromResult(Result<U, std::exception_ptr>&& outcome) {
        if (outcome.IsErr()) {
            return Failure(std::move(outcome).UnwrapErr());
        }
        return Success(T(std::move(outcome).Unwrap()));
    }

    static Try FromErrorResult(Result<std::exception_ptr, std::exception_ptr>&& outcome) {
        if (outcome.IsErr()) {
            return Failure(std::move(outcome).UnwrapErr());
        }
        auto error = std::move(outcome).Unwrap();
        if (!error) {
            return Failure(std::make_exception_ptr(ArgumentError(std::string(ErrorMessages::ERROR_NOT_NULL))));
        }
        return Failure(std::move(error));
    }

    static Try RunSupplier(const Supplier& supplier) {
        AssertNotNull(supplier, ErrorMessages::SUPPLIER_NOT_NULL);
        auto outcome = Capture("Try::CombineGetFirstFailure", supplier);
        if (outcome.IsErr()) {
            return Failure(std::move(outcome).UnwrapErr());
        }
        return std::move(outcome).Unwrap();
    }
};

/// Try of whatever func(args...) returns; void functions give Try<Unit>.
template<typename F, typename... Args>
[[nodiscard]] Try<CaptureValueT<F, Args...>> TryOf(F&& func, Args&&... args) {
    return Try<CaptureValueT<F, Args...>>::OfFunction(std::forward<F>(func), std::forward<Args>(args)...);
}

}

#include "monadic/functional/either.hpp"
#include "monadic/functional/validation.hpp"
