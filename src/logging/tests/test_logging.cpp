// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "Logging.hpp"

#include <cassert>
#include <string>

namespace {

void test_parse_level() {
  assert(pg::Log::parse_level("debug") == pg::Log::Level::Debug);
  assert(pg::Log::parse_level("INFO") == pg::Log::Level::Info);
  assert(pg::Log::parse_level("Warning") == pg::Log::Level::Warning);
  assert(pg::Log::parse_level("warn") == pg::Log::Level::Warning);
  assert(pg::Log::parse_level("error") == pg::Log::Level::Error);
  assert(!pg::Log::parse_level("").has_value());
  assert(!pg::Log::parse_level("verbose").has_value());
  assert(!pg::Log::parse_level("errors").has_value());
}

void test_set_level() {
  pg::Log::set_level(pg::Log::Level::Error);
  assert(pg::Log::level() == pg::Log::Level::Error);
  assert(pg::Log::enabled(pg::Log::Level::Error));
  assert(!pg::Log::enabled(pg::Log::Level::Warning));
  assert(!pg::Log::enabled(pg::Log::Level::Debug));

  pg::Log::set_level(pg::Log::Level::Debug);
  assert(pg::Log::enabled(pg::Log::Level::Debug));
  assert(pg::Log::enabled(pg::Log::Level::Info));
}

void test_log_messages() {
  pg::Log::set_level(pg::Log::Level::Debug);
  std::string name = "pixelgrid";
  pg::Log::d("Debug message from {}", name);
  pg::Log::i("Info message with {} and {}", 1, 2.5);
  pg::Log::w("Warning without arguments");
  pg::Log::e("Error message {}", std::string("rvalue"));

  // Dropped messages must not touch the formatter.
  pg::Log::set_level(pg::Log::Level::Error);
  pg::Log::d("Never printed {}", 42);
}

} // namespace

int main() {
  test_parse_level();
  test_set_level();
  test_log_messages();
}
