// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace pg {

struct Dimensions {
  std::size_t width;
  std::size_t height;

  auto operator==(Dimensions const&) const -> bool = default;
};

template <class Image>
concept HasDimensions = requires(Image const& image) {
  { image.width() } -> std::convertible_to<std::size_t>;
  { image.height() } -> std::convertible_to<std::size_t>;
};

// Anything that can answer whether a grid coordinate belongs to it.
template <class R>
concept Region = requires(R const& region, std::size_t x, std::size_t y) {
  { region.contains(x, y) } -> std::convertible_to<bool>;
};

/**
 * Axis-aligned rectangle in grid coordinates.
 *
 * Covers the columns [left, left + width) and the rows [top, top + height). Empty rects are
 * legal and contain no cell. right() and bottom() name the last covered column and row and must
 * not be called on empty rects.
 */
struct Rect {
  std::size_t left;
  std::size_t top;
  std::size_t width;
  std::size_t height;

  constexpr auto right() const noexcept -> std::size_t {
    assert(!is_empty());
    return left + width - 1;
  }

  constexpr auto bottom() const noexcept -> std::size_t {
    assert(!is_empty());
    return top + height - 1;
  }

  constexpr auto is_empty() const noexcept -> bool { return width == 0 || height == 0; }

  constexpr auto size() const noexcept -> Dimensions { return {width, height}; }

  constexpr auto contains(std::size_t x, std::size_t y) const noexcept -> bool {
    return x >= left && x - left < width && y >= top && y - top < height;
  }

  // True iff the rect lies entirely within [0, bounds.width) x [0, bounds.height).
  constexpr auto fits(Dimensions bounds) const noexcept -> bool {
    return left <= bounds.width && width <= bounds.width - left && top <= bounds.height &&
           height <= bounds.height - top;
  }

  template <HasDimensions Image> constexpr auto fits_image(Image const& image) const -> bool {
    return fits(Dimensions{image.width(), image.height()});
  }

  auto operator==(Rect const&) const -> bool = default;
};

static_assert(Region<Rect>);

// Returns the overlap of two rects, or nullopt if they share no cell.
auto intersect(Rect const& lhs, Rect const& rhs) -> std::optional<Rect>;

/**
 * Moves rect by (dx, dy) and clips the result to [0, bounds.width) x [0, bounds.height).
 *
 * Returns nullopt if nothing of the moved rect remains inside the bounds. The result can be
 * smaller than rect when the move pushes part of it outside.
 */
auto translate_clipped(Rect const& rect, std::int64_t dx, std::int64_t dy, Dimensions bounds)
    -> std::optional<Rect>;

auto to_string(Rect const& rect) -> std::string;
auto to_string(Dimensions const& dimensions) -> std::string;

} // namespace pg
