#include <framebuffer.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <string>

namespace c8
{

framebuffer::framebuffer(std::size_t width, std::size_t height)
  : current(width, height)
{  }

void framebuffer::clear()
{ std::fill(current.cells.begin(), current.cells.end(), 0); }

bool framebuffer::draw_sprite(const std::uint8_t* sprite, std::size_t rows, std::uint32_t x, std::uint32_t y)
{
  bool collision = false;

  const std::size_t start_x = x % current.width;
  const std::size_t start_y = y % current.height;

  for(std::size_t n = 0; n < rows; ++n)
  {
    const std::size_t row = start_y + n;
    if(row >= current.height)
      break;

    for(std::size_t b = 0; b < 8; ++b)
    {
      const std::size_t col = start_x + b;
      if(col >= current.width)
        break;

      if((sprite[n] & (0x80 >> b)) == 0)
        continue;

      auto& cell = current.at(row, col);
      collision = collision || cell == 1;
      cell ^= 1;
    }
  }
  return collision;
}

void print_frame(std::FILE* f, const frame& fr)
{
  std::string line;
  line.reserve(fr.width);

  for(std::size_t row = 0; row < fr.height; ++row)
  {
    line.clear();
    for(std::size_t col = 0; col < fr.width; ++col)
      line += fr.at(row, col) ? '#' : '.';

    fmt::print(f, "{}\n", line);
  }
}

}
