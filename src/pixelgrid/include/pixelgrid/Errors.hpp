// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "pixelgrid/Rect.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

namespace pg {

// Base class of all recoverable image errors.
// Precondition violations (bad coordinates, rects outside the image) throw std::out_of_range.
struct ImageError : public std::runtime_error {
  using std::runtime_error::runtime_error;
};

// Two images, or an image and its pixel data, disagree about their dimensions.
struct DimensionMismatchError : public ImageError {
  using ImageError::ImageError;
};

class RectSizeMismatchError : public ImageError {
public:
  RectSizeMismatchError(Dimensions source, Dimensions destination);

  auto source() const noexcept -> Dimensions { return mSource; }
  auto destination() const noexcept -> Dimensions { return mDestination; }

private:
  Dimensions mSource;
  Dimensions mDestination;
};

class RectFitError : public ImageError {
public:
  RectFitError(std::string_view role, Rect rect, Dimensions bounds);

  auto rect() const noexcept -> Rect { return mRect; }
  auto bounds() const noexcept -> Dimensions { return mBounds; }

private:
  Rect mRect;
  Dimensions mBounds;
};

namespace detail {

// Recoverable checks. Each one logs the rejection at debug level before throwing.

// width * height, or DimensionMismatchError if the product does not fit into std::size_t.
auto checked_cell_count(Dimensions dimensions) -> std::size_t;
void ensure_pixel_count(Dimensions dimensions, std::size_t count);
void ensure_raw_length(Dimensions dimensions, std::size_t length, std::size_t channels);
void ensure_same_dimensions(Dimensions lhs, Dimensions rhs, std::string_view operation);
void ensure_same_size(Rect const& source, Rect const& destination);
void ensure_fits(std::string_view role, Rect const& rect, Dimensions bounds);

// Fatal checks.
[[noreturn]] void throw_pixel_out_of_bounds(std::size_t x, std::size_t y, Dimensions bounds);
[[noreturn]] void throw_rect_out_of_bounds(Rect const& rect, Dimensions bounds);

inline void check_in_bounds(std::size_t x, std::size_t y, Dimensions bounds) {
  if (x >= bounds.width || y >= bounds.height) {
    throw_pixel_out_of_bounds(x, y, bounds);
  }
}

inline void check_in_bounds(Rect const& rect, Dimensions bounds) {
  if (!rect.fits(bounds)) {
    throw_rect_out_of_bounds(rect, bounds);
  }
}

} // namespace detail

} // namespace pg
