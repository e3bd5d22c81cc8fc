#pragma once

#include <cstdint>

namespace c8
{

enum class op_code : std::uint_fast8_t
{
  CLS,
  RET,
  JP,
  CALL,
  SE_IMM,
  SNE_IMM,
  SE_REG,
  LD_IMM,
  ADD_IMM,
  LD_REG,
  OR,
  AND,
  XOR,
  ADD_REG,
  SUB,
  SHR,
  SUBN,
  SHL,
  SNE_REG,
  LD_I,
  JP_V0,
  RND,
  DRW,
  SKP,
  SKNP,
  LD_VX_DT,
  LD_VX_K,
  LD_DT_VX,
  LD_ST_VX,
  ADD_I_VX,
  LD_F_VX,
  LD_B_VX,
  LD_MEM_VX,
  LD_VX_MEM,
  UNKNOWN
};

/// Fields of a 16-bit instruction word. Every word decodes.
struct instruction
{
  constexpr explicit instruction(std::uint16_t word)
    : opcode(word),
      c((word >> 12) & 0xF), x((word >> 8) & 0xF), y((word >> 4) & 0xF), n(word & 0xF),
      nn(word & 0xFF), nnn(word & 0xFFF)
  {  }

  std::uint16_t opcode;

  std::uint8_t c;
  std::uint8_t x;
  std::uint8_t y;
  std::uint8_t n;
  std::uint8_t nn;
  std::uint16_t nnn;
};

// Maps (class, discriminant) to an op_code. Both the interpreter and the
// disassembler dispatch through this.
constexpr op_code classify(const instruction& in)
{
  switch(in.c)
  {
  case 0x0:
    if(in.opcode == 0x00E0) return op_code::CLS;
    if(in.opcode == 0x00EE) return op_code::RET;
    return op_code::UNKNOWN;

  case 0x1: return op_code::JP;
  case 0x2: return op_code::CALL;
  case 0x3: return op_code::SE_IMM;
  case 0x4: return op_code::SNE_IMM;
  case 0x5: return in.n == 0x0 ? op_code::SE_REG : op_code::UNKNOWN;
  case 0x6: return op_code::LD_IMM;
  case 0x7: return op_code::ADD_IMM;

  case 0x8:
    switch(in.n)
    {
    case 0x0: return op_code::LD_REG;
    case 0x1: return op_code::OR;
    case 0x2: return op_code::AND;
    case 0x3: return op_code::XOR;
    case 0x4: return op_code::ADD_REG;
    case 0x5: return op_code::SUB;
    case 0x6: return op_code::SHR;
    case 0x7: return op_code::SUBN;
    case 0xE: return op_code::SHL;
    default:  return op_code::UNKNOWN;
    }

  case 0x9: return in.n == 0x0 ? op_code::SNE_REG : op_code::UNKNOWN;
  case 0xA: return op_code::LD_I;
  case 0xB: return op_code::JP_V0;
  case 0xC: return op_code::RND;
  case 0xD: return op_code::DRW;

  case 0xE:
    switch(in.nn)
    {
    case 0x9E: return op_code::SKP;
    case 0xA1: return op_code::SKNP;
    default:   return op_code::UNKNOWN;
    }

  case 0xF:
    switch(in.nn)
    {
    case 0x07: return op_code::LD_VX_DT;
    case 0x0A: return op_code::LD_VX_K;
    case 0x15: return op_code::LD_DT_VX;
    case 0x18: return op_code::LD_ST_VX;
    case 0x1E: return op_code::ADD_I_VX;
    case 0x29: return op_code::LD_F_VX;
    case 0x33: return op_code::LD_B_VX;
    case 0x55: return op_code::LD_MEM_VX;
    case 0x65: return op_code::LD_VX_MEM;
    default:   return op_code::UNKNOWN;
    }
  }
  return op_code::UNKNOWN;
}

}
