#pragma once

/**
 * @file trace_logger.hpp
 * @brief Debug tracing for captured failures, short-circuit stops and
 *        contract violations.
 *
 * Traces go to stdout. Only enable MONADIC_DEBUG_TRACE while chasing down
 * where an exception was turned into a Failure/Invalid value.
 *
 * Enable via CMake: -DMONADIC_DEBUG_TRACE=ON
 */

#include <cstddef>
#include <cstdio>
#include <exception>
#include <string>
#include <string_view>

#ifdef MONADIC_DEBUG_TRACE
#include "monadic/core/constants.hpp"
#include "monadic/core/failures.hpp"
#include "monadic/core/format.hpp"
#endif

namespace monadic::debug {

enum class Channel {
    Capture,
    Combine,
    Assert
};

inline const char* ChannelToString(Channel channel) {
    switch (channel) {
        case Channel::Capture: return "CAPTURE";
        case Channel::Combine: return "COMBINE";
        case Channel::Assert: return "ASSERT";
    }
    return "";
}

#ifdef MONADIC_DEBUG_TRACE

#define MONADIC_TRACE_MSG(channel, operation, message) \
    do { \
        fprintf(stdout, "%s %s %s %s\n", \
            ::monadic::TraceConstants::PREFIX.data(), \
            ::monadic::debug::ChannelToString(channel), \
            operation, \
            std::string(message).c_str()); \
        fflush(stdout); \
    } while(0)

inline void LogCapturedFailure(std::string_view origin, const std::exception_ptr& error) {
    const auto text = ::monadic::compat::FormatBounded(
        ::monadic::TraceConstants::MAX_MESSAGE_LENGTH,
        "captured in {}: {}", origin, ::monadic::DescribeError(error));
    MONADIC_TRACE_MSG(Channel::Capture, "FAILURE", text);
}

inline void LogShortCircuit(std::string_view combinator, std::size_t index, std::size_t total) {
    const auto text = ::monadic::compat::FormatBounded(
        ::monadic::TraceConstants::MAX_MESSAGE_LENGTH,
        "{} stopped at step {} of {}", combinator, index + 1, total);
    MONADIC_TRACE_MSG(Channel::Combine, "SHORT-CIRCUIT", text);
}

inline void LogArgumentViolation(std::string_view message) {
    MONADIC_TRACE_MSG(Channel::Assert, "VIOLATION", message);
}

#else // !MONADIC_DEBUG_TRACE

#define MONADIC_TRACE_MSG(channel, operation, message) ((void)0)

inline void LogCapturedFailure(std::string_view, const std::exception_ptr&) {}
inline void LogShortCircuit(std::string_view, std::size_t, std::size_t) {}
inline void LogArgumentViolation(std::string_view) {}

#endif // MONADIC_DEBUG_TRACE

} // namespace monadic::debug
