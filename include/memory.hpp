#pragma once

#include <cstdint>
#include <cstddef>
#include <vector>

namespace c8
{

/// Flat, byte addressable store shared by code and data. Words are big-endian.
/// Every access outside [0, size()) throws vm_fault(address_out_of_range).
struct ram
{
public:
  static constexpr std::size_t default_size = 4096;
public:
  explicit ram(std::size_t size = default_size);

  std::uint8_t read_u8(std::uint32_t addr) const;
  void write_u8(std::uint32_t addr, std::uint8_t value);

  std::uint16_t read_u16(std::uint32_t addr) const;
  void write_u16(std::uint32_t addr, std::uint16_t value);

  // Both return the address right after the last written byte.
  std::uint32_t load_block(std::uint32_t addr, const std::vector<std::uint8_t>& bytes);
  std::uint32_t load_block(std::uint32_t addr, const std::vector<std::uint16_t>& words);

  std::size_t size() const
  { return data.size(); }

  const std::vector<std::uint8_t>& bytes() const
  { return data; }
private:
  void check_range(std::uint32_t addr, std::size_t count) const;
private:
  std::vector<std::uint8_t> data;
};

}
