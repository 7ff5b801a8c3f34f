#pragma once
#include <cstdint>
#include <optional>
#include <string>
namespace monadic {
/// Error payload for Validation carrying a priority, so that accumulated
/// errors can be ordered before they are reported.
class ValidationError {
public:
    [[nodiscard]] static ValidationError Of(int32_t priority, std::string error_message);

    /// Sign of priority - other.priority (-1, 0 or 1), or 1 when other is absent.
    [[nodiscard]] int32_t CompareTo(const std::optional<ValidationError>& other) const noexcept;

    [[nodiscard]] int32_t GetPriority() const noexcept { return priority_; }
    [[nodiscard]] const std::string& GetErrorMessage() const noexcept { return error_message_; }

    [[nodiscard]] bool operator==(const ValidationError& other) const noexcept;
    [[nodiscard]] bool operator!=(const ValidationError& other) const noexcept { return !(*this == other); }
    [[nodiscard]] bool operator<(const ValidationError& other) const noexcept;

private:
    ValidationError(int32_t priority, std::string error_message);

    int32_t priority_;
    std::string error_message_;
};
}
