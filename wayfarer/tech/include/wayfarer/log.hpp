#pragma once

// Logging abstraction: spdlog when available; otherwise a lightweight fallback writing to std streams.
#ifdef WAYFARER_ENABLE_SPDLOG
// Header-only usage is forced locally so that consumers linking the compiled spdlog do not get
// redefinition warnings.
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <iostream>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#endif

namespace wayfarer {
#ifdef WAYFARER_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

struct level {
  using level_enum = int;
  static constexpr int trace = 0;
  static constexpr int debug = 1;
  static constexpr int info = 2;
  static constexpr int warn = 3;
  static constexpr int err = 4;
  static constexpr int critical = 5;
  static constexpr int off = 6;
};

inline constexpr const char *kLevelNames[] = {
    "trace", "debug", "info", "warn", "error", "critical", "off",
};

inline level::level_enum &current_level() {
  static level::level_enum lvl = level::info;
  return lvl;
}

inline void set_level(level::level_enum lvl) { current_level() = lvl; }
inline level::level_enum get_level() { return current_level(); }

namespace detail {

// Replaces each '{}' of fmt by the next argument, in order. Extra placeholders are kept verbatim.
inline void append_formatted(std::ostringstream &os, std::string_view fmt) { os << fmt; }

template <typename Arg, typename... Args>
void append_formatted(std::ostringstream &os, std::string_view fmt, Arg &&arg, Args &&...args) {
  const auto pos = fmt.find("{}");
  if (pos == std::string_view::npos) {
    os << fmt;
    return;
  }
  os << fmt.substr(0, pos) << std::forward<Arg>(arg);
  append_formatted(os, fmt.substr(pos + 2), std::forward<Args>(args)...);
}

inline void emit_line(const char *lvlTag, bool isErr, std::string_view msg) {
  auto &os = isErr ? std::cerr : std::cout;
  os << '[' << lvlTag << "] " << msg << '\n';
}

}  // namespace detail

template <typename... Args>
void log(level::level_enum lvl, std::string_view fmt, Args &&...args) {
  if (get_level() <= lvl) {
    std::ostringstream os;
    detail::append_formatted(os, fmt, std::forward<Args>(args)...);
    detail::emit_line(kLevelNames[lvl], lvl >= level::err, os.str());
  }
}

template <typename... Args>
void trace(std::string_view fmt, Args &&...args) {
  log(level::trace, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void debug(std::string_view fmt, Args &&...args) {
  log(level::debug, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void info(std::string_view fmt, Args &&...args) {
  log(level::info, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void warn(std::string_view fmt, Args &&...args) {
  log(level::warn, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void error(std::string_view fmt, Args &&...args) {
  log(level::err, fmt, std::forward<Args>(args)...);
}
template <typename... Args>
void critical(std::string_view fmt, Args &&...args) {
  log(level::critical, fmt, std::forward<Args>(args)...);
}

}  // namespace log
#endif

}  // namespace wayfarer
