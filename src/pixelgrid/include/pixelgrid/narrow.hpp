// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <concepts>
#include <cstddef>
#include <format>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace pg {

struct NarrowError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

/**
 * @brief Converts between integer types, throwing NarrowError if the value is not representable.
 *
 * Grid coordinates are unsigned while translation offsets are signed, so every crossing between
 * the two goes through here.
 */
template <std::integral T, std::integral U> auto narrow(U value) -> T {
  if (!std::in_range<T>(value)) {
    throw NarrowError(std::format("{} does not fit into a {}-bit {} integer", value,
                                  sizeof(T) * 8, std::is_signed_v<T> ? "signed" : "unsigned"));
  }
  return static_cast<T>(value);
}

} // namespace pg
