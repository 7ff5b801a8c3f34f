#pragma once
#include "monadic/core/failures.hpp"
#include "monadic/debug/trace_logger.hpp"
#include <exception>
#include <functional>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
namespace monadic {
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept { return true; }
    constexpr bool operator!=(const Unit&) const noexcept { return false; }
};
inline constexpr Unit unit{};

/// Tagged ok/err outcome of a single callback invocation.
///
/// Combinators that promise exception safety run user callbacks through
/// Capture() and branch on the returned Result instead of letting the
/// exception unwind through them.
template<typename T, typename E>
class Result {
private:
    std::variant<T, E> value_;
public:
    Result(const Result&) = default;
    Result(Result&&) noexcept = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result() = default;
    static Result Ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }
    static Result Err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }
    [[nodiscard]] bool IsOk() const noexcept { return value_.index() == 0; }
    [[nodiscard]] bool IsErr() const noexcept { return value_.index() == 1; }
    [[nodiscard]] const T& Unwrap() const& {
        if (IsErr()) {
            throw StateError("Called Unwrap() on an Err Result");
        }
        return std::get<0>(value_);
    }
    [[nodiscard]] T&& Unwrap() && {
        if (IsErr()) {
            throw StateError("Called Unwrap() on an Err Result");
        }
        return std::get<0>(std::move(value_));
    }
    [[nodiscard]] const E& UnwrapErr() const& {
        if (IsOk()) {
            throw StateError("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(value_);
    }
    [[nodiscard]] E&& UnwrapErr() && {
        if (IsOk()) {
            throw StateError("Called UnwrapErr() on an Ok Result");
        }
        return std::get<1>(std::move(value_));
    }
    using value_type = T;
    using error_type = E;
private:
    template<std::size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : value_(idx, std::forward<Args>(args)...) {}
};

template<typename F, typename... Args>
using CaptureValueT = std::conditional_t<
    std::is_void_v<std::invoke_result_t<F, Args...>>,
    Unit,
    std::decay_t<std::invoke_result_t<F, Args...>>>;

template<typename F, typename... Args>
using CaptureResultT = Result<CaptureValueT<F, Args...>, std::exception_ptr>;

/// Invokes func(args...) and reports either its return value or the
/// exception it threw. Values not derived from std::exception are
/// normalized into monadic::Error. A void return is reported as Unit.
template<typename F, typename... Args>
[[nodiscard]] CaptureResultT<F, Args...> Capture(std::string_view origin, F&& func, Args&&... args) {
    using ResultType = CaptureResultT<F, Args...>;
    std::exception_ptr error;
    try {
        if constexpr (std::is_void_v<std::invoke_result_t<F, Args...>>) {
            std::invoke(std::forward<F>(func), std::forward<Args>(args)...);
            return ResultType::Ok(Unit{});
        } else {
            return ResultType::Ok(std::invoke(std::forward<F>(func), std::forward<Args>(args)...));
        }
    } catch (const std::exception&) {
        error = std::current_exception();
    } catch (...) {
        error = NormalizeUnknownError(std::current_exception());
    }
    debug::LogCapturedFailure(origin, error);
    return ResultType::Err(std::move(error));
}

}
