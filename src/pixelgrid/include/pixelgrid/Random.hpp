// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "pixelgrid/Image.hpp"

#include <concepts>
#include <cstddef>
#include <limits>
#include <random>
#include <type_traits>

namespace pg {

// Fills every channel of every pixel with a value drawn from distribution.
template <Pixel P, class Rng, class Distribution>
  requires std::uniform_random_bit_generator<std::remove_cvref_t<Rng>>
auto random_image(std::size_t width, std::size_t height, Rng& rng, Distribution& distribution)
    -> ImageBuffer<P> {
  using Subpixel = typename P::Subpixel;
  return ImageBuffer<P>::generate(width, height, [&](std::size_t, std::size_t) {
    P pixel{};
    for (Subpixel& channel : pixel.channels_mut()) {
      channel = static_cast<Subpixel>(distribution(rng));
    }
    return pixel;
  });
}

/**
 * Random image with the default distribution of the subpixel type.
 *
 * Integer channels are uniform over the whole range of the type, floating point channels are
 * uniform in [0, 1).
 */
template <Pixel P, class Rng>
  requires std::uniform_random_bit_generator<std::remove_cvref_t<Rng>>
auto random_image(std::size_t width, std::size_t height, Rng& rng) -> ImageBuffer<P> {
  using Subpixel = typename P::Subpixel;
  if constexpr (std::is_floating_point_v<Subpixel>) {
    std::uniform_real_distribution<Subpixel> distribution(Subpixel{0}, Subpixel{1});
    return random_image<P>(width, height, rng, distribution);
  } else {
    static_assert(std::is_integral_v<Subpixel> && !std::is_same_v<Subpixel, bool>,
                  "random_image needs an integer or floating point subpixel type");
    // uniform_int_distribution is not defined for char sized types.
    using Wide = std::conditional_t<std::is_signed_v<Subpixel>, long long, unsigned long long>;
    std::uniform_int_distribution<Wide> distribution(std::numeric_limits<Subpixel>::min(),
                                                     std::numeric_limits<Subpixel>::max());
    return random_image<P>(width, height, rng, distribution);
  }
}

} // namespace pg
