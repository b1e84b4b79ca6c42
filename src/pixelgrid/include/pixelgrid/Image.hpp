// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include "pixelgrid/Errors.hpp"
#include "pixelgrid/Iterators.hpp"
#include "pixelgrid/Pixel.hpp"
#include "pixelgrid/Rect.hpp"

#include <algorithm>
#include <array>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <iterator>
#include <mdspan>
#include <optional>
#include <span>
#include <type_traits>
#include <utility>
#include <vector>

namespace pg {

using Extents = std::dextents<std::size_t, 2>;

enum class StorageKind { Owned, View, ViewMut };

template <Pixel P, StorageKind Kind> class ImageRepr;

// Owns its pixels.
template <Pixel P> using ImageBuffer = ImageRepr<P, StorageKind::Owned>;

// Read-only window into another image. Must not outlive it.
template <Pixel P> using ImageView = ImageRepr<P, StorageKind::View>;

// Writable window into another image. Move-only, must not outlive the image it was taken from,
// and nothing else may touch the covered pixels while it is in use.
template <Pixel P> using ImageViewMut = ImageRepr<P, StorageKind::ViewMut>;

/**
 * A 2D grid of pixels addressed as (x, y), x being the column and y the row.
 *
 * The three storage kinds share this one implementation. Pixels are located through a strided
 * layout: extent 0 is the width, extent 1 is the height, and a sub-image keeps the strides of the
 * image it was cut from. Owned images are always stored in scanline order.
 *
 * Bad coordinates and rects that cross the image bounds throw std::out_of_range. Disagreeing
 * dimensions throw the recoverable errors from Errors.hpp.
 */
template <Pixel P, StorageKind Kind> class ImageRepr {
  static constexpr bool kOwned = Kind == StorageKind::Owned;

public:
  using pixel_type = P;
  using subpixel_type = typename P::Subpixel;
  using element_type = std::conditional_t<Kind == StorageKind::View, P const, P>;
  using mapping_type = std::layout_stride::mapping<Extents>;

  static constexpr StorageKind kStorageKind = Kind;
  static constexpr bool kMutable = Kind != StorageKind::View;

  // An empty 0x0 image.
  ImageRepr() = default;

  // An owned image of the given dimensions filled with value-initialized pixels. Throws
  // DimensionMismatchError if width * height is not representable.
  ImageRepr(std::size_t width, std::size_t height)
    requires kOwned;

  // Throws DimensionMismatchError unless pixels.size() == width * height.
  static auto from_vec(std::size_t width, std::size_t height, std::vector<P> pixels) -> ImageRepr
    requires kOwned;

  // Chunks raw subpixels into pixels. Throws DimensionMismatchError unless the length is a
  // multiple of the channel count and yields exactly width * height pixels.
  static auto from_raw(std::size_t width, std::size_t height,
                       std::span<subpixel_type const> raw) -> ImageRepr
    requires kOwned;

  // Calls fn(x, y) exactly once per cell. Callers must not rely on the visiting order.
  template <class Fn>
    requires std::invocable<Fn&, std::size_t, std::size_t> &&
             std::convertible_to<std::invoke_result_t<Fn&, std::size_t, std::size_t>, P>
  static auto generate(std::size_t width, std::size_t height, Fn fn) -> ImageRepr
    requires kOwned;

  ImageRepr(ImageRepr const&)
    requires(Kind != StorageKind::ViewMut)
  = default;
  auto operator=(ImageRepr const&) -> ImageRepr&
    requires(Kind != StorageKind::ViewMut)
  = default;
  ImageRepr(ImageRepr&& other) noexcept;
  auto operator=(ImageRepr&& other) noexcept -> ImageRepr&;
  ~ImageRepr() = default;

  // Releases the pixels in scanline order. Leaves an empty image behind.
  auto into_raw_vec() && -> std::vector<P>
    requires kOwned;

  auto width() const noexcept -> std::size_t { return mMapping.extents().extent(0); }
  auto height() const noexcept -> std::size_t { return mMapping.extents().extent(1); }
  auto dimensions() const noexcept -> Dimensions { return {width(), height()}; }
  auto rect() const noexcept -> Rect { return Rect{0, 0, width(), height()}; }

  auto data() noexcept -> element_type*;
  auto data() const noexcept -> P const*;

  auto pixels() noexcept -> std::mdspan<element_type, Extents, std::layout_stride> {
    return std::mdspan<element_type, Extents, std::layout_stride>(data(), mMapping);
  }

  auto pixels() const noexcept -> std::mdspan<P const, Extents, std::layout_stride> {
    return std::mdspan<P const, Extents, std::layout_stride>(data(), mMapping);
  }

  auto get_pixel(std::size_t x, std::size_t y) const -> P const&;
  auto get_pixel_mut(std::size_t x, std::size_t y) -> P&
    requires kMutable;
  void put_pixel(std::size_t x, std::size_t y, P pixel)
    requires kMutable;

  auto operator[](std::size_t x, std::size_t y) const -> P const& { return get_pixel(x, y); }
  auto operator[](std::size_t x, std::size_t y) -> element_type&;

  // Only available while the pixels are stored contiguously in scanline order.
  auto as_slice() const -> std::optional<std::span<P const>>;
  auto as_mut_slice() -> std::optional<std::span<P>>
    requires kMutable;

  auto view() const noexcept -> ImageView<P>;
  auto view_mut() noexcept -> ImageViewMut<P>
    requires kMutable;

  auto sub_image(Rect const& rect) const -> ImageView<P>;
  auto sub_image_mut(Rect const& rect) -> ImageViewMut<P>
    requires kMutable;

  auto to_owned() const -> ImageBuffer<P>;

  auto row(std::size_t y) const -> std::optional<RowIter<P>>;
  auto row_mut(std::size_t y) -> std::optional<RowIterMut<P>>
    requires kMutable;
  auto rows() const noexcept -> RowsIter<P>;
  auto rows_mut() noexcept -> RowsIterMut<P>
    requires kMutable;

  auto col(std::size_t x) const -> std::optional<ColIter<P>>;
  auto col_mut(std::size_t x) -> std::optional<ColIterMut<P>>
    requires kMutable;
  auto cols() const noexcept -> ColsIter<P>;
  auto cols_mut() noexcept -> ColsIterMut<P>
    requires kMutable;

  auto rect_iter(Rect const& rect) const -> RectIter<P>;
  auto rect_iter_mut(Rect const& rect) -> RectIterMut<P>
    requires kMutable;

  auto iter() const noexcept -> Iter<P> { return grid(data(), rect()); }
  auto iter_mut() noexcept -> IterMut<P>
    requires kMutable
  {
    return grid(data(), rect());
  }

  auto begin() const noexcept { return iter().begin(); }
  auto end() const noexcept { return iter().end(); }
  auto begin() noexcept
    requires kMutable
  {
    return iter_mut().begin();
  }
  auto end() noexcept
    requires kMutable
  {
    return iter_mut().end();
  }

  // Yields {row, col, pixel} in scanline order.
  auto enumerate_pixels() const noexcept -> Enumerated<P const>;
  auto enumerate_pixels_mut() noexcept -> Enumerated<P>
    requires kMutable;

  void fill(P const& value)
    requires kMutable;

  void fill_rect(Rect const& rect, P const& value)
    requires kMutable;

  /**
   * Copies srcRect of source into dstRect of this image.
   *
   * Cells are paired in scanline order of both rects, which for equally sized rects is the same
   * as copying each source cell to the same relative position. Throws RectSizeMismatchError if
   * the rects differ in size and RectFitError if either rect does not fit its image. Nothing is
   * written unless all checks pass.
   */
  template <StorageKind SourceKind>
  void blit_rect(Rect const& srcRect, Rect const& dstRect, ImageRepr<P, SourceKind> const& source)
    requires kMutable;

  // See translate_clipped().
  auto translate_rect(Rect const& rect, std::int64_t dx, std::int64_t dy) const
      -> std::optional<Rect> {
    return translate_clipped(rect, dx, dy, dimensions());
  }

private:
  template <Pixel, StorageKind> friend class ImageRepr;

  using Storage = std::conditional_t<kOwned, std::vector<P>, element_type*>;

  ImageRepr(std::vector<P> pixels, std::size_t width, std::size_t height)
    requires kOwned;

  ImageRepr(element_type* data, mapping_type mapping) noexcept
    requires(!kOwned);

  static auto scanline_mapping(std::size_t width, std::size_t height) -> mapping_type;

  auto x_stride() const noexcept -> std::ptrdiff_t {
    return static_cast<std::ptrdiff_t>(mMapping.stride(0));
  }
  auto y_stride() const noexcept -> std::ptrdiff_t {
    return static_cast<std::ptrdiff_t>(mMapping.stride(1));
  }

  auto is_contiguous() const noexcept -> bool;
  auto sub_mapping(Rect const& rect) const -> mapping_type;

  // Address of cell (x, y) relative to base. Degenerates to base for empty rects and images,
  // which keeps pointer arithmetic inside the allocation.
  template <class E> auto cell(E* base, std::size_t x, std::size_t y) const noexcept -> E*;
  template <class E> auto cell(E* base, Rect const& rect) const noexcept -> E*;

  template <class E> auto line(E* first, std::ptrdiff_t stride, std::size_t length) const noexcept
      -> Line<E>;
  template <class E> auto grid_cursor(E* base, Rect const& rect) const noexcept -> GridCursor<E>;
  template <class E> auto grid(E* base, Rect const& rect) const noexcept -> Grid<E> {
    return Grid<E>{grid_cursor(base, rect), rect.width * rect.height};
  }

  Storage mData{};
  mapping_type mMapping{};
};

//////////////////////////////////////////////////////////////////////////////////////////////////////
// Implementation Details                                                   ImageRepr<P, Kind>

template <Pixel P, StorageKind Kind>
ImageRepr<P, Kind>::ImageRepr(std::size_t width, std::size_t height)
  requires kOwned
    : mData(detail::checked_cell_count(Dimensions{width, height})),
      mMapping(scanline_mapping(width, height)) {}

template <Pixel P, StorageKind Kind>
ImageRepr<P, Kind>::ImageRepr(std::vector<P> pixels, std::size_t width, std::size_t height)
  requires kOwned
    : mData(std::move(pixels)), mMapping(scanline_mapping(width, height)) {}

template <Pixel P, StorageKind Kind>
ImageRepr<P, Kind>::ImageRepr(element_type* data, mapping_type mapping) noexcept
  requires(!kOwned)
    : mData(data), mMapping(mapping) {}

template <Pixel P, StorageKind Kind>
ImageRepr<P, Kind>::ImageRepr(ImageRepr&& other) noexcept
    : mData(std::exchange(other.mData, Storage{})),
      mMapping(std::exchange(other.mMapping, mapping_type{})) {}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::operator=(ImageRepr&& other) noexcept -> ImageRepr& {
  mData = std::exchange(other.mData, Storage{});
  mMapping = std::exchange(other.mMapping, mapping_type{});
  return *this;
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::scanline_mapping(std::size_t width, std::size_t height) -> mapping_type {
  // Strides must be positive, even for a zero-width image.
  return mapping_type{Extents{width, height},
                      std::array<std::size_t, 2>{1, std::max<std::size_t>(width, 1)}};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::from_vec(std::size_t width, std::size_t height, std::vector<P> pixels)
    -> ImageRepr
  requires kOwned
{
  detail::ensure_pixel_count(Dimensions{width, height}, pixels.size());
  return ImageRepr(std::move(pixels), width, height);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::from_raw(std::size_t width, std::size_t height,
                                  std::span<subpixel_type const> raw) -> ImageRepr
  requires kOwned
{
  constexpr std::size_t channels = P::kChannels;
  detail::ensure_raw_length(Dimensions{width, height}, raw.size(), channels);
  std::vector<P> pixels;
  pixels.reserve(raw.size() / channels);
  for (std::size_t offset = 0; offset < raw.size(); offset += channels) {
    pixels.push_back(P::from_slice(raw.subspan(offset, channels)));
  }
  return ImageRepr(std::move(pixels), width, height);
}

template <Pixel P, StorageKind Kind>
template <class Fn>
  requires std::invocable<Fn&, std::size_t, std::size_t> &&
           std::convertible_to<std::invoke_result_t<Fn&, std::size_t, std::size_t>, P>
auto ImageRepr<P, Kind>::generate(std::size_t width, std::size_t height, Fn fn) -> ImageRepr
  requires kOwned
{
  std::vector<P> pixels;
  pixels.reserve(detail::checked_cell_count(Dimensions{width, height}));
  for (std::size_t y = 0; y < height; ++y) {
    for (std::size_t x = 0; x < width; ++x) {
      pixels.push_back(static_cast<P>(std::invoke(fn, x, y)));
    }
  }
  return ImageRepr(std::move(pixels), width, height);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::into_raw_vec() && -> std::vector<P>
  requires kOwned
{
  mMapping = mapping_type{};
  return std::exchange(mData, std::vector<P>{});
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::data() noexcept -> element_type* {
  if constexpr (kOwned) {
    return mData.data();
  } else {
    return mData;
  }
}

template <Pixel P, StorageKind Kind> auto ImageRepr<P, Kind>::data() const noexcept -> P const* {
  if constexpr (kOwned) {
    return mData.data();
  } else {
    return mData;
  }
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::get_pixel(std::size_t x, std::size_t y) const -> P const& {
  detail::check_in_bounds(x, y, dimensions());
  return data()[mMapping(x, y)];
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::get_pixel_mut(std::size_t x, std::size_t y) -> P&
  requires kMutable
{
  detail::check_in_bounds(x, y, dimensions());
  return data()[mMapping(x, y)];
}

template <Pixel P, StorageKind Kind>
void ImageRepr<P, Kind>::put_pixel(std::size_t x, std::size_t y, P pixel)
  requires kMutable
{
  get_pixel_mut(x, y) = std::move(pixel);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::operator[](std::size_t x, std::size_t y) -> element_type& {
  detail::check_in_bounds(x, y, dimensions());
  return data()[mMapping(x, y)];
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::is_contiguous() const noexcept -> bool {
  if (width() == 0 || height() == 0) {
    return true;
  }
  return mMapping.stride(0) == 1 && (height() == 1 || mMapping.stride(1) == width());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::as_slice() const -> std::optional<std::span<P const>> {
  if (!is_contiguous()) {
    return std::nullopt;
  }
  return std::span<P const>(data(), width() * height());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::as_mut_slice() -> std::optional<std::span<P>>
  requires kMutable
{
  if (!is_contiguous()) {
    return std::nullopt;
  }
  return std::span<P>(data(), width() * height());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::view() const noexcept -> ImageView<P> {
  return ImageView<P>(data(), mMapping);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::view_mut() noexcept -> ImageViewMut<P>
  requires kMutable
{
  return ImageViewMut<P>(data(), mMapping);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::sub_mapping(Rect const& rect) const -> mapping_type {
  return mapping_type{Extents{rect.width, rect.height},
                      std::array<std::size_t, 2>{mMapping.stride(0), mMapping.stride(1)}};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::sub_image(Rect const& rect) const -> ImageView<P> {
  detail::check_in_bounds(rect, dimensions());
  return ImageView<P>(cell(data(), rect), sub_mapping(rect));
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::sub_image_mut(Rect const& rect) -> ImageViewMut<P>
  requires kMutable
{
  detail::check_in_bounds(rect, dimensions());
  return ImageViewMut<P>(cell(data(), rect), sub_mapping(rect));
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::to_owned() const -> ImageBuffer<P> {
  std::vector<P> pixels;
  pixels.reserve(width() * height());
  std::ranges::copy(iter(), std::back_inserter(pixels));
  return ImageBuffer<P>(std::move(pixels), width(), height());
}

template <Pixel P, StorageKind Kind>
template <class E>
auto ImageRepr<P, Kind>::cell(E* base, std::size_t x, std::size_t y) const noexcept -> E* {
  if (width() == 0 || height() == 0) {
    return base;
  }
  return base + static_cast<std::ptrdiff_t>(x) * x_stride() +
         static_cast<std::ptrdiff_t>(y) * y_stride();
}

template <Pixel P, StorageKind Kind>
template <class E>
auto ImageRepr<P, Kind>::cell(E* base, Rect const& rect) const noexcept -> E* {
  if (rect.is_empty()) {
    return base;
  }
  return cell(base, rect.left, rect.top);
}

template <Pixel P, StorageKind Kind>
template <class E>
auto ImageRepr<P, Kind>::line(E* first, std::ptrdiff_t stride, std::size_t length) const noexcept
    -> Line<E> {
  return Line<E>{StrideCursor<E>{first, stride}, length};
}

template <Pixel P, StorageKind Kind>
template <class E>
auto ImageRepr<P, Kind>::grid_cursor(E* base, Rect const& rect) const noexcept -> GridCursor<E> {
  return GridCursor<E>{cell(base, rect), x_stride(), y_stride(),
                       static_cast<std::ptrdiff_t>(std::max<std::size_t>(rect.width, 1))};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::row(std::size_t y) const -> std::optional<RowIter<P>> {
  if (y >= height()) {
    return std::nullopt;
  }
  return line(cell(data(), 0, y), x_stride(), width());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::row_mut(std::size_t y) -> std::optional<RowIterMut<P>>
  requires kMutable
{
  if (y >= height()) {
    return std::nullopt;
  }
  return line(cell(data(), 0, y), x_stride(), width());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::rows() const noexcept -> RowsIter<P> {
  return RowsIter<P>{LineCursor<P const>{data(), y_stride(), x_stride(), width()}, height()};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::rows_mut() noexcept -> RowsIterMut<P>
  requires kMutable
{
  return RowsIterMut<P>{LineCursor<P>{data(), y_stride(), x_stride(), width()}, height()};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::col(std::size_t x) const -> std::optional<ColIter<P>> {
  if (x >= width()) {
    return std::nullopt;
  }
  return line(cell(data(), x, 0), y_stride(), height());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::col_mut(std::size_t x) -> std::optional<ColIterMut<P>>
  requires kMutable
{
  if (x >= width()) {
    return std::nullopt;
  }
  return line(cell(data(), x, 0), y_stride(), height());
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::cols() const noexcept -> ColsIter<P> {
  return ColsIter<P>{LineCursor<P const>{data(), x_stride(), y_stride(), height()}, width()};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::cols_mut() noexcept -> ColsIterMut<P>
  requires kMutable
{
  return ColsIterMut<P>{LineCursor<P>{data(), x_stride(), y_stride(), height()}, width()};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::rect_iter(Rect const& rect) const -> RectIter<P> {
  detail::check_in_bounds(rect, dimensions());
  return grid(data(), rect);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::rect_iter_mut(Rect const& rect) -> RectIterMut<P>
  requires kMutable
{
  detail::check_in_bounds(rect, dimensions());
  return grid(data(), rect);
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::enumerate_pixels() const noexcept -> Enumerated<P const> {
  return Enumerated<P const>{EnumerateCursor<P const>{grid_cursor(data(), rect())},
                             width() * height()};
}

template <Pixel P, StorageKind Kind>
auto ImageRepr<P, Kind>::enumerate_pixels_mut() noexcept -> Enumerated<P>
  requires kMutable
{
  return Enumerated<P>{EnumerateCursor<P>{grid_cursor(data(), rect())}, width() * height()};
}

template <Pixel P, StorageKind Kind>
void ImageRepr<P, Kind>::fill(P const& value)
  requires kMutable
{
  for (P& pixel : iter_mut()) {
    pixel = value;
  }
}

template <Pixel P, StorageKind Kind>
void ImageRepr<P, Kind>::fill_rect(Rect const& rect, P const& value)
  requires kMutable
{
  for (P& pixel : rect_iter_mut(rect)) {
    pixel = value;
  }
}

template <Pixel P, StorageKind Kind>
template <StorageKind SourceKind>
void ImageRepr<P, Kind>::blit_rect(Rect const& srcRect, Rect const& dstRect,
                                   ImageRepr<P, SourceKind> const& source)
  requires kMutable
{
  detail::ensure_same_size(srcRect, dstRect);
  detail::ensure_fits("Source rect", srcRect, source.dimensions());
  detail::ensure_fits("Destination rect", dstRect, dimensions());
  std::ranges::copy(source.rect_iter(srcRect), rect_iter_mut(dstRect).begin());
}

//////////////////////////////////////////////////////////////////////////////////////////////////////
// Comparison

// Equal iff the dimensions match and all pixels compare equal in scanline order.
template <Pixel P, StorageKind LhsKind, StorageKind RhsKind>
auto operator==(ImageRepr<P, LhsKind> const& lhs, ImageRepr<P, RhsKind> const& rhs) -> bool {
  return lhs.dimensions() == rhs.dimensions() && std::ranges::equal(lhs.iter(), rhs.iter());
}

} // namespace pg
