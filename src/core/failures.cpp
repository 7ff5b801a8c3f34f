#include "monadic/core/failures.hpp"
#include "monadic/core/constants.hpp"
#include "monadic/core/format.hpp"

namespace monadic {

    namespace {
        std::string DescribeNonStandard(const std::exception_ptr& error) {
            try {
                std::rethrow_exception(error);
            } catch (const char* text) {
                return text != nullptr ? std::string(text) : std::string(ErrorMessages::UNKNOWN_ERROR_VALUE);
            } catch (const std::string& text) {
                return text;
            } catch (std::string_view text) {
                return std::string(text);
            } catch (int code) {
                return std::to_string(code);
            } catch (long code) {
                return std::to_string(code);
            } catch (long long code) {
                return std::to_string(code);
            } catch (unsigned code) {
                return std::to_string(code);
            } catch (double number) {
                return std::to_string(number);
            } catch (...) {
                return std::string(ErrorMessages::UNKNOWN_ERROR_VALUE);
            }
        }
    }

    const char* FailureTypeToString(const FailureType type) noexcept {
        switch (type) {
            case FailureType::Generic: return "Generic";
            case FailureType::IllegalArgument: return "IllegalArgument";
            case FailureType::IllegalState: return "IllegalState";
        }
        return "Unknown";
    }

    std::string DescribeError(const std::exception_ptr& error) {
        if (!error) {
            return std::string(ErrorMessages::NULL_ERROR_DESCRIPTION);
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& ex) {
            return ex.what();
        } catch (...) {
            return DescribeNonStandard(std::current_exception());
        }
    }

    std::exception_ptr NormalizeUnknownError(const std::exception_ptr& error) {
        if (!error) {
            return std::make_exception_ptr(ArgumentError(std::string(ErrorMessages::ERROR_NOT_NULL)));
        }
        try {
            std::rethrow_exception(error);
        } catch (const std::exception&) {
            return error;
        } catch (...) {
            return std::make_exception_ptr(Error(compat::format("{}{}",
                ErrorMessages::UNKNOWN_ERROR_PREFIX,
                DescribeNonStandard(error))));
        }
    }

}
