// Thread-safe console output for matrixrun.
#pragma once

#include <cstdio>
#include <fmt/color.h>
#include <fmt/format.h>

#include <iterator>
#include <mutex>
#include <string>
#include <string_view>
#include <utility>

namespace matrixrun::detail {

// Shared by stdout progress lines and stderr diagnostics so that lines from
// concurrent cells never interleave.
inline std::mutex &console_mutex() {
    static std::mutex mu;
    return mu;
}

template <typename... Args>
void log_err(fmt::format_string<Args...> format_string, Args &&...args) {
    fmt::memory_buffer buffer;
    buffer.reserve(256);
    fmt::format_to(std::back_inserter(buffer), format_string, std::forward<Args>(args)...);
    std::lock_guard<std::mutex> lock(console_mutex());
    std::fwrite(buffer.data(), 1, buffer.size(), stderr);
    std::fflush(stderr);
}

// Prints "[ TAG  ]" (optionally coloured) followed by the formatted text.
template <typename... Args>
void print_tagged(bool color, fmt::color tag_color, std::string_view tag, fmt::format_string<Args...> format_string, Args &&...args) {
    std::string text = fmt::format(format_string, std::forward<Args>(args)...);
    std::lock_guard<std::mutex> lock(console_mutex());
    if (color)
        fmt::print(fmt::fg(tag_color), "{}", tag);
    else
        fmt::print("{}", tag);
    fmt::print(" {}\n", text);
    std::fflush(stdout);
}

} // namespace matrixrun::detail
