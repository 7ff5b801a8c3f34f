#pragma once

#include <cstddef>
#include <string>
#include <utility>

#if __has_include(<fmt/core.h>)
    #include <fmt/core.h>
    namespace monadic::compat {
        using fmt::format;
        using fmt::format_string;
    }
#elif __has_include(<format>)
    #include <format>
    namespace monadic::compat {
        using std::format;
        using std::format_string;
    }
#else
    #error "Neither fmt nor std::format available"
#endif

namespace monadic::compat {

/// Formats and cuts the result to at most max_length characters, marking the cut with "...".
template<typename... Args>
[[nodiscard]] std::string FormatBounded(std::size_t max_length, format_string<Args...> pattern, Args&&... args) {
    std::string text = compat::format(pattern, std::forward<Args>(args)...);
    if (text.size() <= max_length) {
        return text;
    }
    constexpr std::size_t kEllipsisLength = 3;
    if (max_length <= kEllipsisLength) {
        return text.substr(0, max_length);
    }
    text.resize(max_length - kEllipsisLength);
    text += "...";
    return text;
}

}
