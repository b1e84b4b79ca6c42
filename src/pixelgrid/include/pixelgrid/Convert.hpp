// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "pixelgrid/Image.hpp"

#include <algorithm>
#include <concepts>
#include <functional>
#include <iterator>
#include <type_traits>
#include <utility>
#include <vector>

namespace pg {

/**
 * Builds an owned image of the same dimensions by mapping every pixel through fn.
 *
 * This is the hook for pixel format conversions: fn is called once per pixel in scanline order
 * and may return a pixel type different from the source's.
 */
template <Pixel P, StorageKind Kind, class Fn>
  requires std::invocable<Fn&, P const&> &&
           Pixel<std::remove_cvref_t<std::invoke_result_t<Fn&, P const&>>>
auto map_pixels(ImageRepr<P, Kind> const& image, Fn fn)
    -> ImageBuffer<std::remove_cvref_t<std::invoke_result_t<Fn&, P const&>>> {
  using Target = std::remove_cvref_t<std::invoke_result_t<Fn&, P const&>>;
  std::vector<Target> pixels;
  pixels.reserve(image.width() * image.height());
  std::ranges::transform(image.iter(), std::back_inserter(pixels), std::ref(fn));
  return ImageBuffer<Target>::from_vec(image.width(), image.height(), std::move(pixels));
}

// Converts the subpixel type of every pixel with static_cast, keeping the channel count.
template <class U, class T, std::size_t N, StorageKind Kind>
auto cast_pixels(ImageRepr<Channels<T, N>, Kind> const& image) -> ImageBuffer<Channels<U, N>> {
  return map_pixels(image, [](Channels<T, N> const& pixel) { return pixel.template cast<U>(); });
}

} // namespace pg
