// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <format>
#include <optional>
#include <source_location>
#include <string_view>

namespace pg {

struct Log {
  enum class Level { Debug, Info, Warning, Error };

  // Messages below this level are dropped. Initialised from PIXELGRID_LOG_LEVEL on first use.
  static auto level() noexcept -> Level;
  static void set_level(Level level) noexcept;

  // Accepts "debug", "info", "warning" (or "warn") and "error", case insensitive.
  static auto parse_level(std::string_view text) noexcept -> std::optional<Level>;

  static auto enabled(Level level) noexcept -> bool { return level >= Log::level(); }

  static void vlog(Level, const std::source_location& location, std::string_view fmt,
                   std::format_args args);

  template <typename... Args>
  static void log(Level level, const std::source_location& location, std::string_view fmt,
                  Args&&... args) {
    if (enabled(level)) {
      vlog(level, location, fmt, std::make_format_args(args...));
    }
  }

  template <typename... Args> struct d {
    d(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Debug, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> d(std::string_view, Args&&...) -> d<Args...>;

  template <typename... Args> struct i {
    i(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Info, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> i(std::string_view, Args&&...) -> i<Args...>;

  template <typename... Args> struct w {
    w(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Warning, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> w(std::string_view, Args&&...) -> w<Args...>;

  template <typename... Args> struct e {
    e(std::string_view fmt, Args&&... args,
      const std::source_location& location = std::source_location::current()) {
      log(Level::Error, location, fmt, std::forward<Args>(args)...);
    }
  };
  template <typename... Args> e(std::string_view, Args&&...) -> e<Args...>;
};

} // namespace pg
