#pragma once

#include <stdexcept>
#include <cstdint>
#include <string>

namespace c8
{

enum class fault_kind : unsigned char
{
  unknown_opcode,
  address_out_of_range,
  stack_overflow,
  stack_underflow,
};

const char* to_string(fault_kind kind);

/**
 * Raised by the core when execution cannot continue.
 * `address` is the faulting memory address for address_out_of_range and the
 * instruction address otherwise; `opcode` is the word being executed, if any.
 */
struct vm_fault : std::runtime_error
{
  vm_fault(fault_kind kind, std::uint32_t address, std::uint16_t opcode = 0);

  fault_kind kind;
  std::uint32_t address;
  std::uint16_t opcode;
};

}
