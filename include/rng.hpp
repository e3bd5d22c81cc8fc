#pragma once

#include <cstdint>
#include <random>

namespace c8
{

/// Byte source for RND. Deterministic for a given seed.
struct byte_rng
{
  explicit byte_rng(std::uint32_t seed);

  static std::uint32_t entropy_seed();

  std::uint8_t next();
private:
  std::mt19937 engine;
};

}
