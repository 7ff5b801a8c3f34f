#pragma once
#include "monadic/core/constants.hpp"
#include "monadic/core/nullability.hpp"
#include "monadic/functional/fwd.hpp"
#include <functional>
#include <optional>
#include <type_traits>
#include <utility>
namespace monadic {
namespace detail {
template<typename T, typename = void>
struct HasEqualsMember : std::false_type {};
template<typename T>
struct HasEqualsMember<T, std::void_t<decltype(std::declval<const T&>().Equals(std::declval<const T&>()))>>
    : std::true_type {};

template<typename T>
[[nodiscard]] bool ValueEquals(const T& lhs, const T& rhs) {
    if constexpr (HasEqualsMember<T>::value) {
        return lhs.Equals(rhs);
    } else {
        return lhs == rhs;
    }
}
}

/// A value that is either present or absent. A present Optional never
/// holds a null value (see NullableTraits).
template<typename T>
class Optional {
private:
    std::optional<T> value_;
public:
    using value_type = T;
    Optional() = default;
    [[nodiscard]] static Optional Empty() {
        return Optional();
    }
    [[nodiscard]] static Optional Of(T value) {
        AssertNotNull(value, ErrorMessages::VALUE_NOT_NULL);
        return Optional(std::in_place, std::move(value));
    }
    [[nodiscard]] static Optional OfNullable(T value) {
        if (IsNull(value)) {
            return Empty();
        }
        return Optional(std::in_place, std::move(value));
    }
    [[nodiscard]] static Optional OfNullable(std::optional<T> value) {
        if (!value.has_value()) {
            return Empty();
        }
        return OfNullable(std::move(*value));
    }
    [[nodiscard]] bool IsPresent() const noexcept { return value_.has_value(); }
    [[nodiscard]] bool IsEmpty() const noexcept { return !value_.has_value(); }
    [[nodiscard]] const T& Get() const {
        if (!value_.has_value()) {
            throw ArgumentError(std::string(ErrorMessages::EMPTY_OPTIONAL));
        }
        return *value_;
    }
    template<typename F>
    [[nodiscard]] auto Map(F&& mapper) const -> Optional<std::decay_t<std::invoke_result_t<F, const T&>>> {
        using U = std::decay_t<std::invoke_result_t<F, const T&>>;
        if (!IsPresent()) {
            return Optional<U>::Empty();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return Optional<U>::OfNullable(std::invoke(std::forward<F>(mapper), *value_));
    }
    template<typename F>
    [[nodiscard]] auto FlatMap(F&& mapper) const -> std::decay_t<std::invoke_result_t<F, const T&>> {
        using ResultType = std::decay_t<std::invoke_result_t<F, const T&>>;
        static_assert(IsOptional<ResultType>::value, "FlatMap function must return an Optional");
        if (!IsPresent()) {
            return ResultType::Empty();
        }
        AssertNotNull(mapper, ErrorMessages::MAPPER_NOT_NULL);
        return std::invoke(std::forward<F>(mapper), *value_);
    }
    template<typename Pred>
    [[nodiscard]] Optional Filter(Pred&& predicate) const {
        if (IsPresent() && std::invoke(std::forward<Pred>(predicate), *value_)) {
            return *this;
        }
        return Empty();
    }
    /// Present with pf(value) only when pf is defined at the value;
    /// pf.Apply is never reached outside its domain.
    template<typename R>
    [[nodiscard]] Optional<R> Collect(const PartialFunction<T, R>& partial_function) const {
        if (IsPresent() && partial_function.IsDefinedAt(*value_)) {
            return Optional<R>::OfNullable(partial_function.Apply(*value_));
        }
        return Optional<R>::Empty();
    }
    template<typename FEmpty, typename FPresent>
    [[nodiscard]] auto Fold(FEmpty&& on_empty, FPresent&& on_present) const
        -> std::invoke_result_t<FPresent, const T&> {
        if (IsPresent()) {
            return std::invoke(std::forward<FPresent>(on_present), *value_);
        }
        return std::invoke(std::forward<FEmpty>(on_empty));
    }
    [[nodiscard]] T GetOrElse(T other) const {
        if (IsPresent()) {
            return *value_;
        }
        return other;
    }
    template<typename F>
    [[nodiscard]] T GetOrElseGet(F&& supplier) const {
        if (IsPresent()) {
            return *value_;
        }
        AssertNotNull(supplier, ErrorMessages::SUPPLIER_NOT_NULL);
        return std::invoke(std::forward<F>(supplier));
    }
    [[nodiscard]] Optional OrElse(const Optional& other) const {
        return IsPresent() ? *this : other;
    }
    template<typename F>
    const T& OrElseThrow(F&& error_supplier) const {
        if (IsPresent()) {
            return *value_;
        }
        AssertNotNull(error_supplier, ErrorMessages::SUPPLIER_NOT_NULL);
        throw std::invoke(std::forward<F>(error_supplier));
    }
    template<typename F>
    void IfPresent(F&& action) const {
        if (IsPresent()) {
            AssertNotNull(action, ErrorMessages::ACTION_NOT_NULL);
            std::invoke(std::forward<F>(action), *value_);
        }
    }
    [[nodiscard]] bool Equals(const Optional& other) const {
        if (IsPresent() != other.IsPresent()) {
            return false;
        }
        return !IsPresent() || detail::ValueEquals(*value_, *other.value_);
    }
    [[nodiscard]] bool operator==(const Optional& other) const { return Equals(other); }
    [[nodiscard]] bool operator!=(const Optional& other) const { return !Equals(other); }
private:
    template<typename... Args>
    explicit Optional(std::in_place_t tag, Args&&... args)
        : value_(tag, std::forward<Args>(args)...) {}
};

}

#include "monadic/functional/partial_function.hpp"
