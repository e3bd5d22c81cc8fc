#include <runner.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <fmt/format.h>

#include <chrono>
#include <thread>

namespace host
{

void report(const c8::vm_fault& fault, std::string_view module)
{
  const rom_location loc(module, fault.address);

  switch(fault.kind)
  {
  case c8::fault_kind::unknown_opcode:
    diagnostic <<= diagnostic_db::vm::unknown_opcode(loc, fault.opcode);
    break;
  case c8::fault_kind::address_out_of_range:
    diagnostic <<= diagnostic_db::vm::address_out_of_range(loc, fault.address);
    break;
  case c8::fault_kind::stack_overflow:
    diagnostic <<= diagnostic_db::vm::stack_overflow(loc);
    break;
  case c8::fault_kind::stack_underflow:
    diagnostic <<= diagnostic_db::vm::stack_underflow(loc);
    break;
  }
}

run_stats run_headless(c8::vm& machine, const config_t& cfg, std::string_view module)
{
  run_stats stats;

  const auto start = std::chrono::steady_clock::now();
  try
  {
    while(stats.cycles < cfg.cycles)
    {
      if(stats.cycles != 0 && cfg.cycles_per_frame != 0 && stats.cycles % cfg.cycles_per_frame == 0)
      {
        machine.cycle_timers();
        if(machine.is_sound_on())
          ++stats.sound_frames;
        ++stats.frames;
      }

      machine.cycle();
      ++stats.cycles;

      if(!cfg.fast)
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  catch(const c8::vm_fault& fault)
  {
    report(fault, module);
    stats.faulted = true;
  }
  const auto end = std::chrono::steady_clock::now();

  stats.elapsed_ms = std::chrono::duration<double, std::milli>(end - start).count();
  return stats;
}

void print_stats(std::FILE* f, const run_stats& stats)
{
  const double cps = stats.elapsed_ms > 0.0 ? 1000.0 * stats.cycles / stats.elapsed_ms : 0.0;

  fmt::print(f, "Stats.\n");
  fmt::print(f, "Execution time: {:.0f} ms\n", stats.elapsed_ms);
  fmt::print(f, "Cycles: {}\n", stats.cycles);
  fmt::print(f, "Frames: {}\n", stats.frames);
  fmt::print(f, "Frames with sound: {}\n", stats.sound_frames);
  fmt::print(f, "Cycles per second: {:.1f}\n", cps);
}

}
