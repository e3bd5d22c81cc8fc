#pragma once

#include <profile.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>

enum class emit_classes
{
  undef,
  help,
  run,
  repl,
  disasm,
};

NLOHMANN_JSON_SERIALIZE_ENUM( emit_classes, {
  { emit_classes::undef, "undef" },
  { emit_classes::help, "help" },
  { emit_classes::run, "run" },
  { emit_classes::repl, "repl" },
  { emit_classes::disasm, "disasm" },
})

const static auto emit_classes_list = {
  emit_classes::help,
  emit_classes::run,
  emit_classes::repl,
  emit_classes::disasm,
};

void print_emit_classes(std::FILE* f);

struct config_t
{
  bool print_help { false };

  emit_classes emit_class { emit_classes::run };
  c8::profile_name profile { c8::profile_name::modern };

  std::string rom { "rom/tests/ibm.ch8" };
  std::uint16_t load_address { 0x200 };

  std::optional<std::uint32_t> seed;

  std::size_t cycles { 5000 };
  std::size_t cycles_per_frame { 16 };

  bool trace { false };
  bool fast { false };
};

inline config_t config;
