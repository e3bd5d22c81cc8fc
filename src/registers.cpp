#include <registers.hpp>
#include <vm_fault.hpp>

namespace c8
{

void call_stack::push(std::uint8_t& sp, std::uint16_t addr)
{
  if(sp >= capacity)
    throw vm_fault(fault_kind::stack_overflow, addr);

  slots[sp++] = addr;
}

std::uint16_t call_stack::pop(std::uint8_t& sp)
{
  if(sp == 0)
    throw vm_fault(fault_kind::stack_underflow, 0);

  return slots[--sp];
}

}
