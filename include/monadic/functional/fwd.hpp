#pragma once
#include <type_traits>
namespace monadic {
template<typename T>
class Optional;
template<typename T>
class Try;
template<typename E, typename T>
class Validation;
template<typename L, typename R>
class Either;
template<typename T, typename R>
class PartialFunction;

template<typename T>
struct IsOptional : std::false_type {};
template<typename T>
struct IsOptional<Optional<T>> : std::true_type {};

template<typename T>
struct IsTry : std::false_type {};
template<typename T>
struct IsTry<Try<T>> : std::true_type {};

template<typename T>
struct IsValidation : std::false_type {};
template<typename E, typename T>
struct IsValidation<Validation<E, T>> : std::true_type {};

template<typename T>
struct IsEither : std::false_type {};
template<typename L, typename R>
struct IsEither<Either<L, R>> : std::true_type {};

template<typename T>
struct IsPartialFunction : std::false_type {};
template<typename T, typename R>
struct IsPartialFunction<PartialFunction<T, R>> : std::true_type {};

template<typename T>
inline constexpr bool IsPartialFunctionV = IsPartialFunction<std::remove_cv_t<std::remove_reference_t<T>>>::value;
}
