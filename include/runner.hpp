#pragma once

#include <vm_fault.hpp>
#include <config.hpp>
#include <vm.hpp>

#include <string_view>
#include <cstdio>

namespace host
{

struct run_stats
{
  std::size_t cycles { 0 };
  std::size_t frames { 0 };
  std::size_t sound_frames { 0 };

  double elapsed_ms { 0.0 };

  bool faulted { false };
};

// Turns a core fault into a diagnostic pointing into `module`.
void report(const c8::vm_fault& fault, std::string_view module);

/**
 * Host loop without a window: one instruction per step, timers and sound
 * sampled every `cycles_per_frame` instructions. Stops after `cycles`
 * instructions or at the first fault.
 */
run_stats run_headless(c8::vm& machine, const config_t& cfg, std::string_view module);

void print_stats(std::FILE* f, const run_stats& stats);

}
