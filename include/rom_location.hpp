#pragma once

#include <nlohmann/json.hpp>

#include <string_view>
#include <cstdint>
#include <string>

/// Where a diagnostic points to: a module (ROM path, "args", "repl") and an
/// address inside it.
struct rom_location
{
  std::string_view module;
  std::uint32_t address { 0 };

  rom_location() = default;
  rom_location(std::string_view module, std::uint32_t address = 0);

  std::string to_string() const;

  bool operator==(const rom_location& other) const
  { return module == other.module && address == other.address; }
};

void to_json(nlohmann::json& j, const rom_location& l);
