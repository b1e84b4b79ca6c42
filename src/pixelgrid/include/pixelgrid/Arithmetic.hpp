// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "pixelgrid/Errors.hpp"
#include "pixelgrid/Image.hpp"

#include <algorithm>
#include <concepts>
#include <functional>
#include <iterator>
#include <string_view>
#include <utility>
#include <vector>

namespace pg {

namespace detail {

template <class P, class Op>
concept PixelOperator = requires(Op op, P const& lhs, P const& rhs) {
  { op(lhs, rhs) } -> std::convertible_to<P>;
};

// All operator overloads funnel through here, so only read-only views need to be handled.
template <Pixel P, class Op>
auto zip_pixels(ImageView<P> const& lhs, ImageView<P> const& rhs, Op op,
                std::string_view operation) -> ImageBuffer<P> {
  ensure_same_dimensions(lhs.dimensions(), rhs.dimensions(), operation);
  std::vector<P> pixels;
  pixels.reserve(lhs.width() * lhs.height());
  std::ranges::transform(lhs.iter(), rhs.iter(), std::back_inserter(pixels),
                         [&op](P const& a, P const& b) -> P { return op(a, b); });
  return ImageBuffer<P>::from_vec(lhs.width(), lhs.height(), std::move(pixels));
}

} // namespace detail

// Elementwise image arithmetic. Any two storage kinds can be combined, the result is always a
// new owned image. Throws DimensionMismatchError if the operands differ in size.

template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
  requires detail::PixelOperator<P, std::plus<>>
auto operator+(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs)
    -> ImageBuffer<P> {
  return detail::zip_pixels(lhs.view(), rhs.view(), std::plus<>{}, "addition");
}

template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
  requires detail::PixelOperator<P, std::minus<>>
auto operator-(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs)
    -> ImageBuffer<P> {
  return detail::zip_pixels(lhs.view(), rhs.view(), std::minus<>{}, "subtraction");
}

template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
  requires detail::PixelOperator<P, std::multiplies<>>
auto operator*(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs)
    -> ImageBuffer<P> {
  return detail::zip_pixels(lhs.view(), rhs.view(), std::multiplies<>{}, "multiplication");
}

template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
  requires detail::PixelOperator<P, std::divides<>>
auto operator/(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs)
    -> ImageBuffer<P> {
  return detail::zip_pixels(lhs.view(), rhs.view(), std::divides<>{}, "division");
}

template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
  requires detail::PixelOperator<P, std::modulus<>>
auto operator%(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs)
    -> ImageBuffer<P> {
  return detail::zip_pixels(lhs.view(), rhs.view(), std::modulus<>{}, "remainder");
}

} // namespace pg
