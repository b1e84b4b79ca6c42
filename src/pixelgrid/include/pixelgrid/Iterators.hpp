// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#pragma once

#include <compare>
#include <cstddef>
#include <iterator>
#include <ranges>
#include <type_traits>
#include <utility>

namespace pg {

/**
 * Random access iterator over anything a cursor can address by a linear index.
 *
 * The cursor is copied into the iterator, so iterators stay valid after the range object that
 * produced them is gone. They never outlive the pixels they point to, though.
 */
template <class Cursor> class IndexIterator {
public:
  using reference = decltype(std::declval<Cursor const&>().at(std::ptrdiff_t{}));
  using value_type = std::remove_cvref_t<reference>;
  using difference_type = std::ptrdiff_t;
  using iterator_concept = std::random_access_iterator_tag;
  using iterator_category = std::conditional_t<std::is_reference_v<reference>,
                                               std::random_access_iterator_tag,
                                               std::input_iterator_tag>;

  IndexIterator() = default;

  IndexIterator(Cursor cursor, difference_type index) noexcept
      : mCursor(std::move(cursor)), mIndex(index) {}

  auto operator*() const -> reference { return mCursor.at(mIndex); }
  auto operator[](difference_type n) const -> reference { return mCursor.at(mIndex + n); }

  auto operator++() noexcept -> IndexIterator& {
    ++mIndex;
    return *this;
  }

  auto operator++(int) noexcept -> IndexIterator {
    IndexIterator copy = *this;
    ++mIndex;
    return copy;
  }

  auto operator--() noexcept -> IndexIterator& {
    --mIndex;
    return *this;
  }

  auto operator--(int) noexcept -> IndexIterator {
    IndexIterator copy = *this;
    --mIndex;
    return copy;
  }

  auto operator+=(difference_type n) noexcept -> IndexIterator& {
    mIndex += n;
    return *this;
  }

  auto operator-=(difference_type n) noexcept -> IndexIterator& {
    mIndex -= n;
    return *this;
  }

  friend auto operator+(IndexIterator it, difference_type n) noexcept -> IndexIterator {
    it += n;
    return it;
  }

  friend auto operator+(difference_type n, IndexIterator it) noexcept -> IndexIterator {
    it += n;
    return it;
  }

  friend auto operator-(IndexIterator it, difference_type n) noexcept -> IndexIterator {
    it -= n;
    return it;
  }

  friend auto operator-(IndexIterator const& lhs, IndexIterator const& rhs) noexcept
      -> difference_type {
    return lhs.mIndex - rhs.mIndex;
  }

  friend auto operator==(IndexIterator const& lhs, IndexIterator const& rhs) noexcept -> bool {
    return lhs.mIndex == rhs.mIndex;
  }

  friend auto operator<=>(IndexIterator const& lhs, IndexIterator const& rhs) noexcept
      -> std::strong_ordering {
    return lhs.mIndex <=> rhs.mIndex;
  }

private:
  Cursor mCursor{};
  difference_type mIndex{};
};

// An exactly sized range of `size` elements addressed through a cursor.
template <class Cursor> class IndexRange : public std::ranges::view_interface<IndexRange<Cursor>> {
public:
  using iterator = IndexIterator<Cursor>;

  IndexRange() = default;

  IndexRange(Cursor cursor, std::size_t size) noexcept : mCursor(std::move(cursor)), mSize(size) {}

  auto begin() const noexcept -> iterator { return iterator{mCursor, 0}; }
  auto end() const noexcept -> iterator {
    return iterator{mCursor, static_cast<std::ptrdiff_t>(mSize)};
  }

  auto size() const noexcept -> std::size_t { return mSize; }

private:
  Cursor mCursor{};
  std::size_t mSize{};
};

// Pixels spaced `stride` elements apart: a row, a column, or a contiguous run.
template <class E> struct StrideCursor {
  E* base = nullptr;
  std::ptrdiff_t stride = 0;

  auto at(std::ptrdiff_t index) const -> E& { return base[index * stride]; }
};

template <class E> using Line = IndexRange<StrideCursor<E>>;

// A sequence of lines, either all rows or all columns of an image.
template <class E> struct LineCursor {
  E* base = nullptr;
  std::ptrdiff_t lineStride = 0;
  std::ptrdiff_t elementStride = 0;
  std::size_t length = 0;

  auto at(std::ptrdiff_t index) const -> Line<E> {
    if (length == 0) {
      return Line<E>{StrideCursor<E>{base, elementStride}, 0};
    }
    return Line<E>{StrideCursor<E>{base + index * lineStride, elementStride}, length};
  }
};

template <class E> using Lines = IndexRange<LineCursor<E>>;

// Scanline traversal of a width-wide rectangle.
template <class E> struct GridCursor {
  E* base = nullptr;
  std::ptrdiff_t xStride = 0;
  std::ptrdiff_t yStride = 0;
  std::ptrdiff_t width = 1;

  auto at(std::ptrdiff_t index) const -> E& {
    return base[(index % width) * xStride + (index / width) * yStride];
  }
};

template <class E> using Grid = IndexRange<GridCursor<E>>;

// Note the index order: row first, column second.
template <class E> struct IndexedPixel {
  std::size_t row;
  std::size_t col;
  E& pixel;
};

template <class E> struct EnumerateCursor {
  GridCursor<E> grid{};

  auto at(std::ptrdiff_t index) const -> IndexedPixel<E> {
    return IndexedPixel<E>{static_cast<std::size_t>(index / grid.width),
                           static_cast<std::size_t>(index % grid.width), grid.at(index)};
  }
};

template <class E> using Enumerated = IndexRange<EnumerateCursor<E>>;

template <class P> using RowIter = Line<P const>;
template <class P> using RowIterMut = Line<P>;
template <class P> using ColIter = Line<P const>;
template <class P> using ColIterMut = Line<P>;
template <class P> using RowsIter = Lines<P const>;
template <class P> using RowsIterMut = Lines<P>;
template <class P> using ColsIter = Lines<P const>;
template <class P> using ColsIterMut = Lines<P>;
template <class P> using RectIter = Grid<P const>;
template <class P> using RectIterMut = Grid<P>;
template <class P> using Iter = Grid<P const>;
template <class P> using IterMut = Grid<P>;

} // namespace pg

namespace std::ranges {

template <class Cursor> inline constexpr bool enable_borrowed_range<pg::IndexRange<Cursor>> = true;

} // namespace std::ranges
