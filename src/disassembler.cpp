#include <disassembler.hpp>

#include <fmt/format.h>

namespace c8
{

std::string disassemble(const instruction& in)
{
  switch(classify(in))
  {
  default:
  case op_code::UNKNOWN:   return fmt::format("DW {:#06x}", in.opcode);

  case op_code::CLS:       return "CLS";
  case op_code::RET:       return "RET";
  case op_code::JP:        return fmt::format("JP {:#x}", in.nnn);
  case op_code::CALL:      return fmt::format("CALL {:#x}", in.nnn);
  case op_code::SE_IMM:    return fmt::format("SE V{:X}, {:#x}", in.x, in.nn);
  case op_code::SNE_IMM:   return fmt::format("SNE V{:X}, {:#x}", in.x, in.nn);
  case op_code::SE_REG:    return fmt::format("SE V{:X}, V{:X}", in.x, in.y);
  case op_code::LD_IMM:    return fmt::format("LD V{:X}, {:#x}", in.x, in.nn);
  case op_code::ADD_IMM:   return fmt::format("ADD V{:X}, {:#x}", in.x, in.nn);
  case op_code::LD_REG:    return fmt::format("LD V{:X}, V{:X}", in.x, in.y);
  case op_code::OR:        return fmt::format("OR V{:X}, V{:X}", in.x, in.y);
  case op_code::AND:       return fmt::format("AND V{:X}, V{:X}", in.x, in.y);
  case op_code::XOR:       return fmt::format("XOR V{:X}, V{:X}", in.x, in.y);
  case op_code::ADD_REG:   return fmt::format("ADD V{:X}, V{:X}", in.x, in.y);
  case op_code::SUB:       return fmt::format("SUB V{:X}, V{:X}", in.x, in.y);
  case op_code::SHR:       return fmt::format("SHR V{:X}, V{:X}", in.x, in.y);
  case op_code::SUBN:      return fmt::format("SUBN V{:X}, V{:X}", in.x, in.y);
  case op_code::SHL:       return fmt::format("SHL V{:X}, V{:X}", in.x, in.y);
  case op_code::SNE_REG:   return fmt::format("SNE V{:X}, V{:X}", in.x, in.y);
  case op_code::LD_I:      return fmt::format("LD I, {:#x}", in.nnn);
  case op_code::JP_V0:     return fmt::format("JP V0, {:#x}", in.nnn);
  case op_code::RND:       return fmt::format("RND V{:X}, {:#x}", in.x, in.nn);
  case op_code::DRW:       return fmt::format("DRW V{:X}, V{:X}, {:#x}", in.x, in.y, in.n);
  case op_code::SKP:       return fmt::format("SKP V{:X}", in.x);
  case op_code::SKNP:      return fmt::format("SKNP V{:X}", in.x);
  case op_code::LD_VX_DT:  return fmt::format("LD V{:X}, DT", in.x);
  case op_code::LD_VX_K:   return fmt::format("LD V{:X}, K", in.x);
  case op_code::LD_DT_VX:  return fmt::format("LD DT, V{:X}", in.x);
  case op_code::LD_ST_VX:  return fmt::format("LD ST, V{:X}", in.x);
  case op_code::ADD_I_VX:  return fmt::format("ADD I, V{:X}", in.x);
  case op_code::LD_F_VX:   return fmt::format("LD F, V{:X}", in.x);
  case op_code::LD_B_VX:   return fmt::format("LD B, V{:X}", in.x);
  case op_code::LD_MEM_VX: return fmt::format("LD [I], V{:X}", in.x);
  case op_code::LD_VX_MEM: return fmt::format("LD V{:X}, [I]", in.x);
  }
}

void print_listing(std::FILE* f, const std::vector<std::uint16_t>& code, std::uint32_t begin, std::uint32_t marker)
{
  std::uint32_t addr = begin;
  for(auto word : code)
  {
    fmt::print(f, "{} {:04X}  {:04X}  {}\n", addr == marker ? '>' : ' ', addr, word, disassemble(word));
    addr += 2;
  }
}

}
