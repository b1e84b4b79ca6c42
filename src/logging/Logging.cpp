// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace pg {

namespace {

constexpr const char* kLevelEnvVariable = "PIXELGRID_LOG_LEVEL";

auto initial_level() -> Log::Level {
  if (const char* env = std::getenv(kLevelEnvVariable)) {
    if (auto level = Log::parse_level(env)) {
      return *level;
    }
    std::fprintf(stderr, "Ignoring unknown %s value \"%s\"\n", kLevelEnvVariable, env);
  }
  return Log::Level::Warning;
}

auto level_storage() -> std::atomic<Log::Level>& {
  static std::atomic<Log::Level> level{initial_level()};
  return level;
}

} // namespace

char levelToChar(Log::Level level) {
  switch (level) {
  case Log::Level::Debug:
    return 'D';
  case Log::Level::Error:
    return 'E';
  case Log::Level::Info:
    return 'I';
  case Log::Level::Warning:
    return 'W';
  }
  return 'U';
}

auto Log::level() noexcept -> Level { return level_storage().load(std::memory_order_relaxed); }

void Log::set_level(Level level) noexcept {
  level_storage().store(level, std::memory_order_relaxed);
}

auto Log::parse_level(std::string_view text) noexcept -> std::optional<Level> {
  auto equals = [text](std::string_view name) {
    return std::ranges::equal(text, name, [](unsigned char lhs, unsigned char rhs) {
      return std::tolower(lhs) == std::tolower(rhs);
    });
  };
  if (equals("debug")) {
    return Level::Debug;
  } else if (equals("info")) {
    return Level::Info;
  } else if (equals("warning") || equals("warn")) {
    return Level::Warning;
  } else if (equals("error")) {
    return Level::Error;
  }
  return std::nullopt;
}

void Log::vlog(Level level, const std::source_location& location, std::string_view fmt,
               std::format_args args) {
  std::string message = std::vformat(fmt, args);
  std::filesystem::path file = location.file_name();
  std::string file_name = file.filename();
  int pid = ::getpid();
  int tid = ::gettid();
  std::fprintf(stderr, "[%s:%u] %c %d-%d %s\n", file_name.c_str(), location.line(),
               levelToChar(level), pid, tid, message.c_str());
}

} // namespace pg
