#include <memory.hpp>
#include <vm_fault.hpp>

namespace c8
{

ram::ram(std::size_t size)
  : data(size, 0)
{  }

void ram::check_range(std::uint32_t addr, std::size_t count) const
{
  if(addr >= data.size() || count > data.size() - addr)
    throw vm_fault(fault_kind::address_out_of_range, addr);
}

std::uint8_t ram::read_u8(std::uint32_t addr) const
{
  check_range(addr, 1);
  return data[addr];
}

void ram::write_u8(std::uint32_t addr, std::uint8_t value)
{
  check_range(addr, 1);
  data[addr] = value;
}

std::uint16_t ram::read_u16(std::uint32_t addr) const
{
  check_range(addr, 2);
  return static_cast<std::uint16_t>((data[addr] << 8) | data[addr + 1]);
}

void ram::write_u16(std::uint32_t addr, std::uint16_t value)
{
  check_range(addr, 2);
  data[addr]     = static_cast<std::uint8_t>((value & 0xFF00) >> 8);
  data[addr + 1] = static_cast<std::uint8_t>(value & 0x00FF);
}

std::uint32_t ram::load_block(std::uint32_t addr, const std::vector<std::uint8_t>& bytes)
{
  if(bytes.empty())
    return addr;
  check_range(addr, bytes.size());

  for(auto b : bytes)
    data[addr++] = b;
  return addr;
}

std::uint32_t ram::load_block(std::uint32_t addr, const std::vector<std::uint16_t>& words)
{
  if(words.empty())
    return addr;
  check_range(addr, words.size() * 2);

  for(auto w : words)
  {
    write_u16(addr, w);
    addr += 2;
  }
  return addr;
}

}
