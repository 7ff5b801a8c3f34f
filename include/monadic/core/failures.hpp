#pragma once
#include <exception>
#include <stdexcept>
#include <string>
#include <string_view>
namespace monadic {
enum class FailureType {
    Generic,
    IllegalArgument,
    IllegalState
};
class Error : public std::runtime_error {
public:
    explicit Error(std::string msg)
        : Error(FailureType::Generic, std::move(msg)) {}
    [[nodiscard]] FailureType Type() const noexcept { return type_; }
    static Error Generic(std::string msg) {
        return Error(FailureType::Generic, std::move(msg));
    }
protected:
    Error(const FailureType t, std::string msg)
        : std::runtime_error(std::move(msg)), type_(t) {}
private:
    FailureType type_;
};
/// Contract violation: a required argument was null or empty at the point of use.
class ArgumentError : public Error {
public:
    explicit ArgumentError(std::string msg)
        : Error(FailureType::IllegalArgument, std::move(msg)) {}
};
/// Accessor called on the wrong variant.
class StateError : public Error {
public:
    explicit StateError(std::string msg)
        : Error(FailureType::IllegalState, std::move(msg)) {}
};
[[nodiscard]] const char* FailureTypeToString(FailureType type) noexcept;
[[nodiscard]] std::string DescribeError(const std::exception_ptr& error);
/// Wraps a thrown value that does not derive from std::exception into an Error.
[[nodiscard]] std::exception_ptr NormalizeUnknownError(const std::exception_ptr& error);
}
