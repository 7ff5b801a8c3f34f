#pragma once
#include "monadic/core/constants.hpp"
#include "monadic/core/failures.hpp"
#include "monadic/debug/trace_logger.hpp"
#include <cstddef>
#include <exception>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
namespace monadic {

/// Tells whether a value of T can be null, and whether a given value is.
///
/// Only handle-like types are nullable: raw and smart pointers,
/// std::function, std::exception_ptr and std::optional. Every other type
/// is never null, so a container holding it can only be empty through its
/// own absent variant.
template<typename T>
struct NullableTraits {
    static constexpr bool IS_NULLABLE = false;
    static constexpr bool IsNull(const T&) noexcept { return false; }
};
template<typename T>
struct NullableTraits<T*> {
    static constexpr bool IS_NULLABLE = true;
    static constexpr bool IsNull(T* const value) noexcept { return value == nullptr; }
};
template<>
struct NullableTraits<std::nullptr_t> {
    static constexpr bool IS_NULLABLE = true;
    static constexpr bool IsNull(std::nullptr_t) noexcept { return true; }
};
template<typename T, typename D>
struct NullableTraits<std::unique_ptr<T, D>> {
    static constexpr bool IS_NULLABLE = true;
    static bool IsNull(const std::unique_ptr<T, D>& value) noexcept { return value == nullptr; }
};
template<typename T>
struct NullableTraits<std::shared_ptr<T>> {
    static constexpr bool IS_NULLABLE = true;
    static bool IsNull(const std::shared_ptr<T>& value) noexcept { return value == nullptr; }
};
template<typename Signature>
struct NullableTraits<std::function<Signature>> {
    static constexpr bool IS_NULLABLE = true;
    static bool IsNull(const std::function<Signature>& value) noexcept { return !static_cast<bool>(value); }
};
template<>
struct NullableTraits<std::exception_ptr> {
    static constexpr bool IS_NULLABLE = true;
    static bool IsNull(const std::exception_ptr& value) noexcept { return !value; }
};
template<typename T>
struct NullableTraits<std::optional<T>> {
    static constexpr bool IS_NULLABLE = true;
    static constexpr bool IsNull(const std::optional<T>& value) noexcept { return !value.has_value(); }
};

template<typename T>
inline constexpr bool IsNullableV = NullableTraits<std::remove_cv_t<T>>::IS_NULLABLE;

template<typename T>
[[nodiscard]] bool IsNull(const T& value) noexcept {
    return NullableTraits<std::remove_cv_t<T>>::IsNull(value);
}

template<typename T>
[[nodiscard]] bool NonNull(const T& value) noexcept {
    return !IsNull(value);
}

/// Throws ArgumentError when value is null.
template<typename T>
void AssertNotNull(const T& value, std::string_view message = ErrorMessages::VALUE_NOT_NULL) {
    if (IsNull(value)) {
        debug::LogArgumentViolation(message);
        throw ArgumentError(std::string(message));
    }
}

}
