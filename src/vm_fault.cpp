#include <vm_fault.hpp>

#include <fmt/format.h>

namespace c8
{

const char* to_string(fault_kind kind)
{
  switch(kind)
  {
  case fault_kind::unknown_opcode:       return "unknown opcode";
  case fault_kind::address_out_of_range: return "address out of range";
  case fault_kind::stack_overflow:       return "stack overflow";
  case fault_kind::stack_underflow:      return "stack underflow";
  }
  return "fault";
}

vm_fault::vm_fault(fault_kind kind, std::uint32_t address, std::uint16_t opcode)
  : std::runtime_error(fmt::format("{} at 0x{:04X} (opcode 0x{:04X})", to_string(kind), address, opcode)),
    kind(kind), address(address), opcode(opcode)
{  }

}
