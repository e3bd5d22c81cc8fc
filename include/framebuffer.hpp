#pragma once

#include <cstdint>
#include <cstddef>
#include <cstdio>
#include <vector>

namespace c8
{

/// Pixel grid, one byte per cell holding 0 or 1, row-major.
struct frame
{
  frame(std::size_t width, std::size_t height)
    : width(width), height(height), cells(width * height, 0)
  {  }

  std::uint8_t at(std::size_t row, std::size_t col) const
  { return cells[row * width + col]; }

  std::uint8_t& at(std::size_t row, std::size_t col)
  { return cells[row * width + col]; }

  std::size_t width;
  std::size_t height;
  std::vector<std::uint8_t> cells;
};

struct framebuffer
{
public:
  static constexpr std::size_t default_width = 64;
  static constexpr std::size_t default_height = 32;
public:
  framebuffer(std::size_t width = default_width, std::size_t height = default_height);

  void clear();

  /**
   * XOR the sprite (one byte per row, MSB leftmost) into the grid.
   * The start position wraps around the screen, the sprite itself is clipped
   * at the right and bottom edges.
   *
   * @return true if any set pixel was erased
   */
  bool draw_sprite(const std::uint8_t* sprite, std::size_t rows, std::uint32_t x, std::uint32_t y);

  bool draw_sprite(const std::vector<std::uint8_t>& sprite, std::uint32_t x, std::uint32_t y)
  { return draw_sprite(sprite.data(), sprite.size(), x, y); }

  const frame& get_frame() const
  { return current; }
private:
  frame current;
};

void print_frame(std::FILE* f, const frame& fr);

}
