// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "pixelgrid/Errors.hpp"

#include "Logging.hpp"

#include <format>
#include <limits>

namespace pg {

RectSizeMismatchError::RectSizeMismatchError(Dimensions source, Dimensions destination)
    : ImageError(std::format("Rects are not the same size. Source is {}, destination is {}",
                             to_string(source), to_string(destination))),
      mSource(source), mDestination(destination) {}

RectFitError::RectFitError(std::string_view role, Rect rect, Dimensions bounds)
    : ImageError(std::format("{} {} does not fit {} image", role, to_string(rect),
                             to_string(bounds))),
      mRect(rect), mBounds(bounds) {}

namespace detail {

auto checked_cell_count(Dimensions dimensions) -> std::size_t {
  if (dimensions.height != 0 &&
      dimensions.width > std::numeric_limits<std::size_t>::max() / dimensions.height) {
    Log::d("Rejecting {} image, the cell count overflows", to_string(dimensions));
    throw DimensionMismatchError(
        std::format("Image dimensions {} exceed the addressable cell count", to_string(dimensions)));
  }
  return dimensions.width * dimensions.height;
}

void ensure_pixel_count(Dimensions dimensions, std::size_t count) {
  const std::size_t expected = checked_cell_count(dimensions);
  if (count != expected) {
    Log::d("Rejecting {} pixels for a {} image", count, to_string(dimensions));
    throw DimensionMismatchError(std::format("Buffer has incorrect size {}, expected {} for {}",
                                             count, expected, to_string(dimensions)));
  }
}

void ensure_raw_length(Dimensions dimensions, std::size_t length, std::size_t channels) {
  if (channels == 0 || length % channels != 0) {
    Log::d("Rejecting {} subpixels, not a multiple of {} channels", length, channels);
    throw DimensionMismatchError(std::format(
        "Buffer length {} is not a multiple of the channel count {}", length, channels));
  }
  ensure_pixel_count(dimensions, length / channels);
}

void ensure_same_dimensions(Dimensions lhs, Dimensions rhs, std::string_view operation) {
  if (lhs != rhs) {
    Log::d("Rejecting {} of a {} and a {} image", operation, to_string(lhs), to_string(rhs));
    throw DimensionMismatchError(std::format("Image dimensions do not match for {}: {} vs {}",
                                             operation, to_string(lhs), to_string(rhs)));
  }
}

void ensure_same_size(Rect const& source, Rect const& destination) {
  if (source.size() != destination.size()) {
    Log::d("Rejecting blit from {} to {}", to_string(source), to_string(destination));
    throw RectSizeMismatchError(source.size(), destination.size());
  }
}

void ensure_fits(std::string_view role, Rect const& rect, Dimensions bounds) {
  if (!rect.fits(bounds)) {
    Log::d("{} {} is outside of a {} image", role, to_string(rect), to_string(bounds));
    throw RectFitError(role, rect, bounds);
  }
}

void throw_pixel_out_of_bounds(std::size_t x, std::size_t y, Dimensions bounds) {
  throw std::out_of_range(
      std::format("Pixel ({}, {}) is out of bounds for a {} image", x, y, to_string(bounds)));
}

void throw_rect_out_of_bounds(Rect const& rect, Dimensions bounds) {
  throw std::out_of_range(
      std::format("{} crosses the bounds of a {} image", to_string(rect), to_string(bounds)));
}

} // namespace detail

} // namespace pg
