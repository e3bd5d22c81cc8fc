#pragma once

#include <vm_opcodes.hpp>
#include <framebuffer.hpp>
#include <registers.hpp>
#include <profile.hpp>
#include <memory.hpp>
#include <rng.hpp>

#include <cstdio>
#include <vector>
#include <array>

namespace c8
{

struct vm
{
public:
  static constexpr std::size_t key_count = 16;
  static constexpr std::size_t digit_count = 16;
  static constexpr std::size_t digit_rows = 5;

  using keypad = std::array<bool, key_count>;
public:
  explicit vm(quirk_profile profile);
  vm(quirk_profile profile, std::uint32_t seed);

  void key_press(std::uint8_t key);
  void key_unpress(std::uint8_t key);

  void set_pc(std::uint16_t addr);

  // Words are read big-endian from `rom`; a trailing odd byte is ignored.
  void load_rom(const std::vector<std::uint8_t>& rom, std::uint16_t start);

  /**
   * Fetch, decode and execute one instruction. PC is advanced past the
   * instruction before it runs.
   *
   * Throws vm_fault; PC then points at the faulting instruction again.
   */
  void cycle();

  void cycle_timers();

  bool is_sound_on() const;

  const frame& get_frame() const;

  // Instruction trace, one line per cycle. nullptr disables it.
  void set_trace(std::FILE* out);

  std::uint16_t digit_address(std::uint8_t digit) const;

  const register_file& registers() const { return regs; }
  register_file& registers() { return regs; }

  const ram& memory() const { return mem; }
  ram& memory() { return mem; }

  const call_stack& stack() const { return calls; }
  const keypad& keys() const { return keypad_state; }
  const quirk_profile& profile() const { return quirks; }
private:
  void load_digits();

  void execute(const instruction& in);

  void skip_if(bool cond);
private:
  ram mem;
  register_file regs;
  call_stack calls;
  keypad keypad_state;
  framebuffer display;
  byte_rng rnd;
  quirk_profile quirks;

  std::array<std::uint16_t, digit_count> digit_addr;

  std::FILE* trace { nullptr };
};

}
