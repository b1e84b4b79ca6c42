// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <array>
#include <concepts>
#include <cstddef>
#include <format>
#include <functional>
#include <span>
#include <stdexcept>
#include <string_view>

namespace pg {

/**
 * Concept for the element type stored in an image.
 *
 * A pixel is a regular value type holding exactly P::kChannels subpixels of type P::Subpixel.
 * from_slice() and set_to_slice() read the first kChannels values of the slice and do not accept
 * shorter slices: a short slice is a programming error and throws std::out_of_range.
 */
template <class P>
concept Pixel = std::regular<P> && requires(P pixel, P const& constPixel,
                                            std::span<typename P::Subpixel const> slice) {
  typename P::Subpixel;
  { P::kChannels } -> std::convertible_to<std::size_t>;
  { constPixel.channels() } -> std::convertible_to<std::span<typename P::Subpixel const>>;
  { pixel.channels_mut() } -> std::convertible_to<std::span<typename P::Subpixel>>;
  { P::from_slice(slice) } -> std::same_as<P>;
  pixel.set_to_slice(slice);
  { constPixel.map(std::identity{}) } -> std::same_as<P>;
};

// Adds up all channels of a pixel, starting from a value-initialized subpixel.
template <Pixel P>
  requires requires(typename P::Subpixel a) {
    { a + a } -> std::convertible_to<typename P::Subpixel>;
  }
constexpr auto sum(P const& pixel) -> typename P::Subpixel {
  using Subpixel = typename P::Subpixel;
  Subpixel total{};
  for (Subpixel const& channel : pixel.channels()) {
    total = static_cast<Subpixel>(total + channel);
  }
  return total;
}

/**
 * A fixed-arity tuple of channel values with no color semantics attached.
 *
 * Arithmetic operators work channel by channel and cast the result back to T, so unsigned
 * channels wrap the same way the underlying integer type does. Dividing integer channels by a
 * zero channel throws std::domain_error.
 */
template <class T, std::size_t N> struct Channels {
  using Subpixel = T;
  static constexpr std::size_t kChannels = N;

  std::array<T, N> data{};

  constexpr auto channels() const noexcept -> std::span<T const, N> { return data; }
  constexpr auto channels_mut() noexcept -> std::span<T, N> { return data; }

  constexpr auto operator[](std::size_t channel) -> T& { return data[channel]; }
  constexpr auto operator[](std::size_t channel) const -> T const& { return data[channel]; }

  static auto from_slice(std::span<T const> slice) -> Channels {
    Channels pixel;
    pixel.set_to_slice(slice);
    return pixel;
  }

  void set_to_slice(std::span<T const> slice) {
    if (slice.size() < N) {
      throw std::out_of_range(
          std::format("Pixel slice holds {} values but {} channels are required", slice.size(), N));
    }
    for (std::size_t i = 0; i < N; ++i) {
      data[i] = slice[i];
    }
  }

  template <class Fn>
    requires std::invocable<Fn&, T const&>
  constexpr auto map(Fn fn) const -> Channels {
    Channels result;
    for (std::size_t i = 0; i < N; ++i) {
      result.data[i] = static_cast<T>(std::invoke(fn, data[i]));
    }
    return result;
  }

  template <class U> constexpr auto cast() const -> Channels<U, N> {
    Channels<U, N> result;
    for (std::size_t i = 0; i < N; ++i) {
      result.data[i] = static_cast<U>(data[i]);
    }
    return result;
  }

  constexpr auto operator==(Channels const&) const -> bool = default;

  friend constexpr auto operator+(Channels const& lhs, Channels const& rhs) -> Channels {
    return lhs.zip(rhs, std::plus<>{});
  }

  friend constexpr auto operator-(Channels const& lhs, Channels const& rhs) -> Channels {
    return lhs.zip(rhs, std::minus<>{});
  }

  friend constexpr auto operator*(Channels const& lhs, Channels const& rhs) -> Channels {
    return lhs.zip(rhs, std::multiplies<>{});
  }

  friend constexpr auto operator/(Channels const& lhs, Channels const& rhs) -> Channels {
    rhs.check_divisor("division");
    return lhs.zip(rhs, std::divides<>{});
  }

  friend constexpr auto operator%(Channels const& lhs, Channels const& rhs) -> Channels
    requires requires(T a) { a % a; }
  {
    rhs.check_divisor("remainder");
    return lhs.zip(rhs, std::modulus<>{});
  }

private:
  constexpr void check_divisor(std::string_view operation) const {
    if constexpr (std::integral<T>) {
      for (std::size_t i = 0; i < N; ++i) {
        if (data[i] == T{}) {
          throw std::domain_error(std::format("Integer {} by zero in channel {}", operation, i));
        }
      }
    }
  }

  template <class Op> constexpr auto zip(Channels const& rhs, Op op) const -> Channels {
    Channels result;
    for (std::size_t i = 0; i < N; ++i) {
      result.data[i] = static_cast<T>(op(data[i], rhs.data[i]));
    }
    return result;
  }
};

} // namespace pg
