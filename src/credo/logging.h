#ifndef CREDO_LOGGING_H
#define CREDO_LOGGING_H

#include <cstdio>
#include <cstdlib>
#include <fmt/color.h>
#include <fmt/core.h>
#include <string_view>
#include <utility>

namespace credo_log {

// Returns true if CREDO_DEBUG is set
inline bool is_debug_enabled() { return std::getenv("CREDO_DEBUG") != nullptr; }

inline void warning(std::string_view msg) {
  fmt::print(stderr, fg(fmt::color::yellow) | fmt::emphasis::bold,
             "[WARNING] ");
  fmt::print(stderr, "{}\n", msg);
}

inline void debug(std::string_view msg) {
  if (is_debug_enabled()) {
    fmt::print(fg(fmt::color::blue) | fmt::emphasis::bold, "[DEBUG] ");
    fmt::print("{}\n", msg);
  }
}

template <typename... Args>
inline void warning(fmt::format_string<Args...> fmt_str, Args &&...args) {
  warning(std::string_view(fmt::format(fmt_str, std::forward<Args>(args)...)));
}

template <typename... Args>
inline void debug(fmt::format_string<Args...> fmt_str, Args &&...args) {
  if (is_debug_enabled()) {
    fmt::print(fg(fmt::color::blue) | fmt::emphasis::bold, "[DEBUG] ");
    fmt::print(fmt_str, std::forward<Args>(args)...);
    fmt::print("\n");
  }
}

} // namespace credo_log

#endif // CREDO_LOGGING_H
