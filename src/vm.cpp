#include <vm.hpp>
#include <vm_fault.hpp>
#include <disassembler.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <stdexcept>

namespace c8
{

namespace
{
  using glyph = std::array<std::uint8_t, vm::digit_rows>;

  const std::array<glyph, vm::digit_count> digit_glyphs = {{
    { 0b01100000, 0b10010000, 0b10010000, 0b10010000, 0b01100000 }, // 0
    { 0b00100000, 0b01100000, 0b00100000, 0b00100000, 0b01110000 }, // 1
    { 0b11110000, 0b00010000, 0b11110000, 0b10000000, 0b11110000 }, // 2
    { 0b11100000, 0b00010000, 0b11100000, 0b00010000, 0b11100000 }, // 3
    { 0b10010000, 0b10010000, 0b11110000, 0b00010000, 0b00010000 }, // 4
    { 0b11110000, 0b10000000, 0b11100000, 0b00010000, 0b11100000 }, // 5
    { 0b01110000, 0b10000000, 0b11100000, 0b10010000, 0b11100000 }, // 6
    { 0b11110000, 0b00010000, 0b00100000, 0b01000000, 0b01000000 }, // 7
    { 0b01100000, 0b10010000, 0b01100000, 0b10010000, 0b01100000 }, // 8
    { 0b01100000, 0b10010000, 0b01110000, 0b00010000, 0b11100000 }, // 9
    { 0b01100000, 0b10010000, 0b11110000, 0b10010000, 0b10010000 }, // A
    { 0b11100000, 0b10010000, 0b11100000, 0b10010000, 0b11100000 }, // B
    { 0b01110000, 0b10000000, 0b10000000, 0b10000000, 0b01110000 }, // C
    { 0b11100000, 0b10010000, 0b10010000, 0b10010000, 0b11100000 }, // D
    { 0b11110000, 0b10000000, 0b11110000, 0b10000000, 0b11110000 }, // E
    { 0b11110000, 0b10000000, 0b11110000, 0b10000000, 0b10000000 }, // F
  }};
}

vm::vm(quirk_profile profile)
  : vm(profile, byte_rng::entropy_seed())
{  }

vm::vm(quirk_profile profile, std::uint32_t seed)
  : mem(), regs(), calls(), keypad_state(), display(), rnd(seed), quirks(profile), digit_addr()
{
  load_digits();
}

void vm::load_digits()
{
  std::uint32_t addr = 0x000;
  for(std::size_t d = 0; d < digit_glyphs.size(); ++d)
  {
    digit_addr[d] = static_cast<std::uint16_t>(addr);
    addr = mem.load_block(addr, std::vector<std::uint8_t>(digit_glyphs[d].begin(), digit_glyphs[d].end()));
  }
}

std::uint16_t vm::digit_address(std::uint8_t digit) const
{ return digit_addr[digit & 0xF]; }

void vm::key_press(std::uint8_t key)
{
  if(key >= key_count)
    throw std::out_of_range("key index out of range");
  keypad_state[key] = true;
}

void vm::key_unpress(std::uint8_t key)
{
  if(key >= key_count)
    throw std::out_of_range("key index out of range");
  keypad_state[key] = false;
}

void vm::set_pc(std::uint16_t addr)
{ regs.pc = addr; }

void vm::set_trace(std::FILE* out)
{ trace = out; }

void vm::load_rom(const std::vector<std::uint8_t>& rom, std::uint16_t start)
{
  std::vector<std::uint16_t> code;
  code.reserve(rom.size() / 2);

  for(std::size_t i = 0; i + 1 < rom.size(); i += 2)
    code.push_back(static_cast<std::uint16_t>((rom[i] << 8) | rom[i + 1]));

  mem.load_block(start, code);
}

const frame& vm::get_frame() const
{ return display.get_frame(); }

bool vm::is_sound_on() const
{ return regs.st > 0; }

void vm::cycle_timers()
{
  if(regs.dt > 0)
    --regs.dt;
  if(regs.st > 0)
    --regs.st;

  if(trace != nullptr)
    fmt::print(trace, "timers dt={} st={}\n", regs.dt, regs.st);
}

void vm::cycle()
{
  const std::uint16_t pc = regs.pc;
  std::uint16_t word = 0;

  try
  {
    word = mem.read_u16(pc);
    const instruction in(word);

    // PC points to the next instruction while this one executes.
    regs.pc = static_cast<std::uint16_t>(pc + 2);

    if(trace != nullptr)
      fmt::print(trace, "[PC:0x{:04x}] {}\n", pc, disassemble(in));

    execute(in);
  }
  catch(const vm_fault& fault)
  {
    regs.pc = pc;
    if(fault.kind == fault_kind::address_out_of_range)
      throw vm_fault(fault.kind, fault.address, word);
    throw vm_fault(fault.kind, pc, word);
  }
}

void vm::skip_if(bool cond)
{
  if(cond)
    regs.pc = static_cast<std::uint16_t>(regs.pc + 2);
}

void vm::execute(const instruction& in)
{
  auto& v = regs.v;
  auto& vx = v[in.x];
  const std::uint8_t vy = v[in.y];

  switch(classify(in))
  {
  case op_code::UNKNOWN:
      throw vm_fault(fault_kind::unknown_opcode, regs.pc - 2, in.opcode);

  case op_code::CLS:
      display.clear();
      break;

  case op_code::RET:
      regs.pc = calls.pop(regs.sp);
      break;

  case op_code::JP:
      regs.pc = in.nnn;
      break;

  case op_code::CALL:
      calls.push(regs.sp, regs.pc);
      regs.pc = in.nnn;
      break;

  case op_code::SE_IMM:  skip_if(vx == in.nn); break;
  case op_code::SNE_IMM: skip_if(vx != in.nn); break;
  case op_code::SE_REG:  skip_if(vx == vy);    break;
  case op_code::SNE_REG: skip_if(vx != vy);    break;

  case op_code::LD_IMM:
      vx = in.nn;
      break;

  case op_code::ADD_IMM:
      vx = static_cast<std::uint8_t>(vx + in.nn);
      break;

  case op_code::LD_REG: vx = vy;  break;
  case op_code::OR:     vx |= vy; break;
  case op_code::AND:    vx &= vy; break;
  case op_code::XOR:    vx ^= vy; break;

  case op_code::ADD_REG:
      {
        const unsigned sum = vx + vy;

        vx = static_cast<std::uint8_t>(sum);
        v[register_file::flag] = sum > 0xFF ? 1 : 0;
      } break;

  case op_code::SUB:
      {
        const bool no_borrow = vx >= vy;

        vx = static_cast<std::uint8_t>(vx - vy);
        v[register_file::flag] = no_borrow ? 1 : 0;
      } break;

  case op_code::SUBN:
      {
        const bool no_borrow = vy >= vx;

        vx = static_cast<std::uint8_t>(vy - vx);
        v[register_file::flag] = no_borrow ? 1 : 0;
      } break;

  case op_code::SHR:
      {
        if(quirks.shr_copies_vy)
          vx = vy;
        const std::uint8_t out = vx & 0x01;

        vx = static_cast<std::uint8_t>(vx >> 1);
        v[register_file::flag] = out;
      } break;

  case op_code::SHL:
      {
        if(quirks.shl_copies_vy)
          vx = vy;
        const std::uint8_t out = (vx & 0x80) != 0 ? 1 : 0;

        vx = static_cast<std::uint8_t>(vx << 1);
        v[register_file::flag] = out;
      } break;

  case op_code::LD_I:
      regs.i = in.nnn;
      break;

  case op_code::JP_V0:
      regs.pc = static_cast<std::uint16_t>(v[0] + in.nnn);
      break;

  case op_code::RND:
      vx = rnd.next() & in.nn;
      break;

  case op_code::DRW:
      {
        std::vector<std::uint8_t> sprite(in.n);
        for(std::size_t k = 0; k < sprite.size(); ++k)
          sprite[k] = mem.read_u8(regs.i + k);

        const bool collision = display.draw_sprite(sprite, vx, vy);
        v[register_file::flag] = collision ? 1 : 0;
      } break;

  case op_code::SKP:  skip_if(keypad_state[vx & 0xF]);  break;
  case op_code::SKNP: skip_if(!keypad_state[vx & 0xF]); break;

  case op_code::LD_VX_DT:
      vx = regs.dt;
      break;

  case op_code::LD_VX_K:
      {
        auto it = std::find(keypad_state.begin(), keypad_state.end(), true);
        if(it == keypad_state.end())
          regs.pc = static_cast<std::uint16_t>(regs.pc - 2); // run this instruction again
        else
          vx = static_cast<std::uint8_t>(it - keypad_state.begin());
      } break;

  case op_code::LD_DT_VX:
      regs.dt = vx;
      break;

  case op_code::LD_ST_VX:
      regs.st = vx;
      break;

  case op_code::ADD_I_VX:
      regs.i = static_cast<std::uint16_t>(regs.i + vx);
      break;

  case op_code::LD_F_VX:
      regs.i = digit_address(vx);
      break;

  case op_code::LD_B_VX:
      {
        const std::vector<std::uint8_t> bcd = {
          static_cast<std::uint8_t>(vx / 100),
          static_cast<std::uint8_t>((vx / 10) % 10),
          static_cast<std::uint8_t>(vx % 10),
        };
        mem.load_block(regs.i, bcd);
      } break;

  case op_code::LD_MEM_VX:
      {
        mem.load_block(regs.i, std::vector<std::uint8_t>(v.begin(), v.begin() + in.x + 1));

        if(quirks.store_dump_advances_i)
          regs.i = static_cast<std::uint16_t>(regs.i + in.x + 1);
      } break;

  case op_code::LD_VX_MEM:
      {
        // read everything first, registers stay untouched on a fault
        std::array<std::uint8_t, register_file::register_count> loaded { };
        for(std::size_t k = 0; k <= in.x; ++k)
          loaded[k] = mem.read_u8(regs.i + k);
        std::copy(loaded.begin(), loaded.begin() + in.x + 1, v.begin());

        if(quirks.store_load_advances_i)
          regs.i = static_cast<std::uint16_t>(regs.i + in.x + 1);
      } break;
  }
}

}
