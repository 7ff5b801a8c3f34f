#pragma once
#include <cstddef>
#include <string_view>
namespace monadic {
struct ErrorMessages {
    static constexpr std::string_view UNKNOWN_ERROR_PREFIX = "An unknown error was thrown, error = ";
    static constexpr std::string_view UNKNOWN_ERROR_VALUE = "<unknown>";
    static constexpr std::string_view NULL_ERROR_DESCRIPTION = "<null error>";
    static constexpr std::string_view VALUE_NOT_NULL = "value must be not null";
    static constexpr std::string_view ERROR_NOT_NULL = "error must be not null";
    static constexpr std::string_view MAPPER_NOT_NULL = "mapper must be not null";
    static constexpr std::string_view KEY_MAPPER_NOT_NULL = "keyMapper must be not null";
    static constexpr std::string_view VALUE_MAPPER_NOT_NULL = "valueMapper must be not null";
    static constexpr std::string_view AFTER_NOT_NULL = "after must be not null";
    static constexpr std::string_view BEFORE_NOT_NULL = "before must be not null";
    static constexpr std::string_view DEFAULT_FUNCTION_NOT_NULL = "defaultFunction must be not null";
    static constexpr std::string_view ERROR_MAPPER_NOT_NULL = "errorMapper must be not null";
    static constexpr std::string_view SUPPLIER_NOT_NULL = "supplier must be not null";
    static constexpr std::string_view ACTION_NOT_NULL = "action must be not null";
    static constexpr std::string_view EMPTY_OPTIONAL = "Is not possible to get a value of an empty Optional";
    static constexpr std::string_view SUCCESS_HAS_NO_ERROR = "Is not possible to get exception value of a 'Success' Try";
    static constexpr std::string_view EMPTY_SUCCESS = "Is not possible to get a value of an empty 'Success' Try";
    static constexpr std::string_view VALID_HAS_NO_ERRORS = "Is not possible to get errors of a 'Valid' Validation";
    static constexpr std::string_view INVALID_HAS_NO_VALUE = "Is not possible to get a value of an 'Invalid' Validation";
    static constexpr std::string_view EMPTY_VALID = "Is not possible to get a value of an empty 'Valid' Validation";
    static constexpr std::string_view LEFT_HAS_NO_RIGHT = "Is not possible to get right value of a 'Left' Either";
    static constexpr std::string_view EMPTY_RIGHT = "Is not possible to get a value of an empty 'Right' Either";
    static constexpr std::string_view RIGHT_HAS_NO_LEFT = "Is not possible to get left value of a 'Right' Either";
};
struct TraceConstants {
    static constexpr std::string_view PREFIX = "[MONADIC-TRACE]";
    static constexpr std::size_t MAX_MESSAGE_LENGTH = 256;
};
}
