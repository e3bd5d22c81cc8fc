#include <rng.hpp>

namespace c8
{

byte_rng::byte_rng(std::uint32_t seed)
  : engine(seed)
{  }

std::uint32_t byte_rng::entropy_seed()
{
  std::random_device dev;
  return dev();
}

std::uint8_t byte_rng::next()
{
  // top byte of a 32-bit draw
  return static_cast<std::uint8_t>(engine() >> 24);
}

}
