// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "pixelgrid/Rect.hpp"
#include "pixelgrid/narrow.hpp"

#include <algorithm>
#include <cstdint>
#include <format>
#include <limits>

namespace pg {

namespace {

constexpr std::size_t kMaxCoordinate = std::numeric_limits<std::size_t>::max();

// Exclusive end of [start, start + length), saturated instead of wrapping.
auto saturating_end(std::size_t start, std::size_t length) noexcept -> std::size_t {
  return length > kMaxCoordinate - start ? kMaxCoordinate : start + length;
}

struct Span {
  std::size_t start;
  std::size_t end;
};

// Moves [start, end) by delta and clips it to [0, bound). Unsigned throughout, extreme deltas
// clip instead of overflowing.
auto shift_and_clip(std::size_t start, std::size_t end, std::int64_t delta, std::size_t bound)
    -> std::optional<Span> {
  if (delta >= 0) {
    const auto offset = narrow<std::uint64_t>(delta);
    if (start >= bound || offset >= bound - start) {
      return std::nullopt;
    }
    const std::size_t shiftedEnd = end > bound || offset > bound - end ? bound : end + offset;
    return Span{start + offset, shiftedEnd};
  }
  // -(delta + 1) is representable even for the minimum int64 value.
  const std::uint64_t offset = narrow<std::uint64_t>(-(delta + 1)) + 1;
  if (end <= offset) {
    return std::nullopt;
  }
  const std::size_t shiftedStart = start > offset ? start - offset : 0;
  const std::size_t shiftedEnd = std::min(end - offset, bound);
  if (shiftedStart >= shiftedEnd) {
    return std::nullopt;
  }
  return Span{shiftedStart, shiftedEnd};
}

} // namespace

auto intersect(Rect const& lhs, Rect const& rhs) -> std::optional<Rect> {
  if (lhs.is_empty() || rhs.is_empty()) {
    return std::nullopt;
  }
  const std::size_t left = std::max(lhs.left, rhs.left);
  const std::size_t top = std::max(lhs.top, rhs.top);
  const std::size_t right =
      std::min(saturating_end(lhs.left, lhs.width), saturating_end(rhs.left, rhs.width));
  const std::size_t bottom =
      std::min(saturating_end(lhs.top, lhs.height), saturating_end(rhs.top, rhs.height));
  if (left >= right || top >= bottom) {
    return std::nullopt;
  }
  return Rect{left, top, right - left, bottom - top};
}

auto translate_clipped(Rect const& rect, std::int64_t dx, std::int64_t dy, Dimensions bounds)
    -> std::optional<Rect> {
  if (rect.is_empty()) {
    return std::nullopt;
  }
  const auto columns =
      shift_and_clip(rect.left, saturating_end(rect.left, rect.width), dx, bounds.width);
  const auto rows =
      shift_and_clip(rect.top, saturating_end(rect.top, rect.height), dy, bounds.height);
  if (!columns || !rows) {
    return std::nullopt;
  }
  return Rect{columns->start, rows->start, columns->end - columns->start,
              rows->end - rows->start};
}

auto to_string(Rect const& rect) -> std::string {
  return std::format("Rect(left={}, top={}, width={}, height={})", rect.left, rect.top, rect.width,
                     rect.height);
}

auto to_string(Dimensions const& dimensions) -> std::string {
  return std::format("{}x{}", dimensions.width, dimensions.height);
}

} // namespace pg
