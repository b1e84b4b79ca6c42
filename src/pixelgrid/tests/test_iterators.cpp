// SPDX-License-Identifier: MIT
// SPDX-FileCopyrightText: 2026 Maikel Nadolski <maikel.nadolski@gmail.com>

#include "pixelgrid/Image.hpp"

#include <algorithm>
#include <cassert>
#include <cstdint>
#include <iterator>
#include <ranges>
#include <stdexcept>
#include <vector>

namespace {

using Luma8 = pg::Channels<std::uint8_t, 1>;

static_assert(std::ranges::random_access_range<pg::Iter<Luma8>>);
static_assert(std::ranges::random_access_range<pg::RowIterMut<Luma8>>);
static_assert(std::ranges::random_access_range<pg::RowsIter<Luma8>>);
static_assert(std::ranges::sized_range<pg::RectIter<Luma8>>);
static_assert(std::ranges::sized_range<pg::ColsIterMut<Luma8>>);
static_assert(std::ranges::borrowed_range<pg::ColIter<Luma8>>);
static_assert(std::ranges::view<pg::Enumerated<Luma8 const>>);
static_assert(std::random_access_iterator<pg::Iter<Luma8>::iterator>);

auto three_by_three() -> pg::ImageBuffer<Luma8> {
  const std::vector<std::uint8_t> raw{0, 1, 2, 3, 4, 5, 6, 7, 8};
  return pg::ImageBuffer<Luma8>::from_raw(3, 3, raw);
}

template <std::ranges::input_range Range> auto values_of(Range&& range) -> std::vector<int> {
  std::vector<int> values;
  for (Luma8 const& pixel : range) {
    values.push_back(pixel[0]);
  }
  return values;
}

void test_row() {
  const auto image = three_by_three();
  assert(values_of(*image.row(0)) == (std::vector<int>{0, 1, 2}));
  assert(values_of(*image.row(1)) == (std::vector<int>{3, 4, 5}));
  assert(values_of(*image.row(2)) == (std::vector<int>{6, 7, 8}));
  assert(!image.row(3).has_value());
  assert(image.row(1)->size() == 3);
}

void test_row_mut() {
  auto image = three_by_three();
  for (std::uint8_t factor = 2; factor <= 4; ++factor) {
    auto row = *image.row_mut(factor - 2u);
    for (Luma8& pixel : row) {
      pixel[0] = static_cast<std::uint8_t>(pixel[0] * factor);
    }
  }
  assert(!image.row_mut(3).has_value());
  assert(values_of(image) == (std::vector<int>{0, 2, 4, 9, 12, 15, 24, 28, 32}));
}

void test_rows() {
  const auto image = three_by_three();
  std::size_t y = 0;
  for (auto row : image.rows()) {
    std::size_t x = 0;
    for (Luma8 const& pixel : row) {
      assert(pixel[0] == x + 3 * y);
      ++x;
    }
    assert(x == 3);
    ++y;
  }
  assert(y == 3);
  assert(image.rows().size() == 3);
}

void test_rows_mut() {
  auto image = three_by_three();
  std::size_t y = 0;
  for (auto row : image.rows_mut()) {
    std::size_t x = 0;
    for (Luma8& pixel : row) {
      pixel[0] = static_cast<std::uint8_t>(3 * x + 5 * y);
      ++x;
    }
    ++y;
  }
  for (auto [row, col, pixel] : image.enumerate_pixels()) {
    assert(pixel[0] == 3 * col + 5 * row);
  }
}

void test_col() {
  const auto image = three_by_three();
  assert(values_of(*image.col(0)) == (std::vector<int>{0, 3, 6}));
  assert(values_of(*image.col(1)) == (std::vector<int>{1, 4, 7}));
  assert(values_of(*image.col(2)) == (std::vector<int>{2, 5, 8}));
  assert(!image.col(3).has_value());
}

void test_col_mut() {
  auto image = three_by_three();
  for (std::uint8_t factor = 2; factor <= 4; ++factor) {
    auto col = *image.col_mut(factor - 2u);
    for (Luma8& pixel : col) {
      pixel[0] = static_cast<std::uint8_t>(pixel[0] * factor);
    }
  }
  assert(!image.col_mut(3).has_value());
  assert(values_of(image) == (std::vector<int>{0, 3, 8, 6, 12, 20, 12, 21, 32}));
}

void test_cols() {
  const auto image = three_by_three();
  std::size_t x = 0;
  for (auto col : image.cols()) {
    std::size_t y = 0;
    for (Luma8 const& pixel : col) {
      assert(pixel[0] == x + 3 * y);
      ++y;
    }
    assert(y == 3);
    ++x;
  }
  assert(x == 3);
}

void test_cols_mut() {
  auto image = three_by_three();
  std::size_t x = 0;
  for (auto col : image.cols_mut()) {
    std::size_t y = 0;
    for (Luma8& pixel : col) {
      pixel[0] = static_cast<std::uint8_t>(3 * x + 5 * y);
      ++y;
    }
    ++x;
  }
  for (auto [row, col, pixel] : image.enumerate_pixels()) {
    assert(pixel[0] == 3 * col + 5 * row);
  }
}

void test_rect_iter() {
  std::vector<Luma8> pixels;
  for (std::uint8_t n = 1; n <= 15; ++n) {
    pixels.push_back(Luma8{{n}});
  }
  const auto image = pg::ImageBuffer<Luma8>::from_vec(5, 3, pixels);
  assert(values_of(image.rect_iter(pg::Rect{1, 1, 3, 1})) == (std::vector<int>{7, 8, 9}));
  assert(values_of(image.rect_iter(pg::Rect{3, 0, 2, 3})) ==
         (std::vector<int>{4, 5, 9, 10, 14, 15}));
  assert(image.rect_iter(pg::Rect{0, 0, 0, 3}).empty());

  try {
    (void)image.rect_iter(pg::Rect{4, 0, 2, 1});
    assert(false); // Should not reach here
  } catch (const std::out_of_range&) {
  }
}

void test_rect_iter_mut() {
  pg::ImageBuffer<Luma8> image(4, 4);
  for (Luma8& pixel : image.rect_iter_mut(pg::Rect{1, 2, 2, 2})) {
    pixel[0] = 1;
  }
  assert(values_of(image) ==
         (std::vector<int>{0, 0, 0, 0, 0, 0, 0, 0, 0, 1, 1, 0, 0, 1, 1, 0}));
}

void test_iter_matches_scanline_order() {
  const auto image = three_by_three();
  assert(image.iter().size() == 9);
  assert(values_of(image.iter()) == (std::vector<int>{0, 1, 2, 3, 4, 5, 6, 7, 8}));
  auto it = image.iter().begin();
  assert((it[4] == Luma8{{4}}));
  assert(image.iter().end() - it == 9);
  it += 7;
  assert((*it == Luma8{{7}}));
}

void test_reverse_iteration() {
  const auto image = three_by_three();
  assert(values_of(image.iter() | std::views::reverse) ==
         (std::vector<int>{8, 7, 6, 5, 4, 3, 2, 1, 0}));
  assert(values_of(*image.col(1) | std::views::reverse) == (std::vector<int>{7, 4, 1}));

  std::vector<int> lastColumnFirst;
  for (auto col : image.cols() | std::views::reverse) {
    lastColumnFirst.push_back(col.front()[0]);
  }
  assert(lastColumnFirst == (std::vector<int>{2, 1, 0}));
}

void test_enumerate_order() {
  auto image = pg::ImageBuffer<Luma8>::generate(5, 3, [](std::size_t x, std::size_t y) {
    return Luma8{{static_cast<std::uint8_t>(2 * x + 3 * y)}};
  });
  std::size_t index = 0;
  for (auto [row, col, pixel] : image.enumerate_pixels()) {
    assert(row == index / 5);
    assert(col == index % 5);
    assert(pixel[0] == 2 * col + 3 * row);
    ++index;
  }
  assert(index == 15);

  for (auto [row, col, pixel] : image.enumerate_pixels_mut()) {
    pixel[0] = static_cast<std::uint8_t>(row * 10 + col);
  }
  assert(image.get_pixel(4, 2)[0] == 24);
}

void test_iterators_on_sub_image() {
  auto image = pg::ImageBuffer<Luma8>::generate(6, 5, [](std::size_t x, std::size_t y) {
    return Luma8{{static_cast<std::uint8_t>(10 * y + x)}};
  });
  auto sub = image.sub_image(pg::Rect{2, 1, 3, 3});
  assert(values_of(sub) == (std::vector<int>{12, 13, 14, 22, 23, 24, 32, 33, 34}));
  assert(values_of(*sub.row(2)) == (std::vector<int>{32, 33, 34}));
  assert(values_of(*sub.col(0)) == (std::vector<int>{12, 22, 32}));
  assert(!sub.col(3).has_value());
  assert(values_of(sub.rect_iter(pg::Rect{1, 1, 2, 2})) == (std::vector<int>{23, 24, 33, 34}));
  assert(sub.rows().size() == 3);
  assert(sub.cols().size() == 3);

  auto window = image.sub_image_mut(pg::Rect{1, 3, 4, 2});
  for (auto col : window.cols_mut()) {
    for (Luma8& pixel : col) {
      pixel[0] = 0;
    }
  }
  for (auto [y, x, pixel] : image.enumerate_pixels()) {
    const bool cleared = x >= 1 && x <= 4 && y >= 3;
    assert(pixel[0] == (cleared ? 0 : 10 * y + x));
  }
}

void test_empty_image() {
  pg::ImageBuffer<Luma8> image(0, 4);
  assert(image.iter().empty());
  assert(image.rows().size() == 4);
  for (auto row : image.rows()) {
    assert(row.empty());
  }
  assert(image.cols().empty());
  assert(!image.row(0)->size());
  assert(!image.col(0).has_value());
  assert(image.enumerate_pixels().empty());
}

void test_iterators_outlive_range_object() {
  const auto image = three_by_three();
  auto it = image.row(2)->begin();
  assert((*it == Luma8{{6}}));
  ++it;
  assert((*it == Luma8{{7}}));

  auto found = std::ranges::find(image.iter(), Luma8{{5}});
  assert(found - image.iter().begin() == 5);
}

} // namespace

int main() {
  test_row();
  test_row_mut();
  test_rows();
  test_rows_mut();
  test_col();
  test_col_mut();
  test_cols();
  test_cols_mut();
  test_rect_iter();
  test_rect_iter_mut();
  test_iter_matches_scanline_order();
  test_reverse_iteration();
  test_enumerate_order();
  test_iterators_on_sub_image();
  test_empty_image();
  test_iterators_outlive_range_object();
}
