#include <rom_location.hpp>

#include <fmt/format.h>

rom_location::rom_location(std::string_view module, std::uint32_t address)
  : module(module), address(address)
{  }

std::string rom_location::to_string() const
{ return fmt::format("{}:0x{:04X}", module, address); }

void to_json(nlohmann::json& j, const rom_location& l)
{
  j = nlohmann::json{
    { "module", l.module },
    { "address", l.address },
  };
}
