#pragma once

// Logging abstraction: spdlog when available; otherwise a lightweight fallback.
#ifdef HTTPLIKE_ENABLE_SPDLOG
#ifndef SPDLOG_HEADER_ONLY
#define SPDLOG_HEADER_ONLY
#endif
#include <spdlog/common.h>  // IWYU pragma: export
#include <spdlog/spdlog.h>  // IWYU pragma: export
#else
#include <chrono>
#include <format>
#include <iostream>
#include <string>
#include <string_view>
#endif

namespace httplike {
#ifdef HTTPLIKE_ENABLE_SPDLOG
namespace log = spdlog;
#else
namespace log {

// Subset of spdlog's levels that this project emits or sets.
struct level {
  using level_enum = int;
  static constexpr int debug = 1;
  static constexpr int info = 2;
  static constexpr int off = 6;
};

inline level::level_enum &current_level() {
  static level::level_enum lvl = level::info;
  return lvl;
}

inline void set_level(level::level_enum lvl) { current_level() = lvl; }
inline level::level_enum get_level() { return current_level(); }

template <typename... Args>
void debug(std::string_view fmt, Args &&...args) {
  if (get_level() > level::debug) {
    return;
  }
  std::string msg;
  if constexpr (sizeof...(Args) == 0) {
    msg = fmt;
  } else {
    msg = std::vformat(fmt, std::make_format_args(args...));
  }
  const auto now = std::chrono::floor<std::chrono::milliseconds>(std::chrono::system_clock::now());
  std::cout << std::format("[{:%FT%T}Z] [debug] {}\n", now, msg);
}

}  // namespace log
#endif

}  // namespace httplike
