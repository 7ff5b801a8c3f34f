#include "monadic/functional/validation_error.hpp"
#include <utility>

namespace monadic {

    ValidationError::ValidationError(const int32_t priority, std::string error_message)
        : priority_(priority)
        , error_message_(std::move(error_message)) {
    }

    ValidationError ValidationError::Of(const int32_t priority, std::string error_message) {
        return ValidationError(priority, std::move(error_message));
    }

    int32_t ValidationError::CompareTo(const std::optional<ValidationError>& other) const noexcept {
        if (!other.has_value()) {
            return 1;
        }
        const int32_t other_priority = other->priority_;
        return (priority_ > other_priority) - (priority_ < other_priority);
    }

    bool ValidationError::operator==(const ValidationError& other) const noexcept {
        return priority_ == other.priority_ && error_message_ == other.error_message_;
    }

    bool ValidationError::operator<(const ValidationError& other) const noexcept {
        return priority_ < other.priority_;
    }

}
