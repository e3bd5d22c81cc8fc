#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace c8
{

struct register_file
{
  static constexpr std::size_t register_count = 16;
  static constexpr std::size_t flag = 0xF; // VF

  std::array<std::uint8_t, register_count> v { };

  std::uint16_t i { 0 };
  std::uint8_t dt { 0 };
  std::uint8_t st { 0 };

  std::uint16_t pc { 0 };
  std::uint8_t sp { 0 };
};

/// Return addresses for CALL/RET. The depth is the register file's SP.
struct call_stack
{
public:
  static constexpr std::size_t capacity = 16;
public:
  void push(std::uint8_t& sp, std::uint16_t addr);
  std::uint16_t pop(std::uint8_t& sp);

  std::uint16_t operator[](std::size_t idx) const
  { return slots[idx]; }
private:
  std::array<std::uint16_t, capacity> slots { };
};

}
