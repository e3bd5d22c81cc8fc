#include <rom_reader.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>

#include <fstream>
#include <iterator>

namespace rom_reader
{

std::optional<std::vector<std::uint8_t>> read(const std::string& path, std::uint32_t load_address,
                                              std::size_t memory_size)
{
  const rom_location loc(path, 0);

  std::ifstream file(path, std::ios::in | std::ios::binary);
  if(!file)
  {
    diagnostic <<= diagnostic_db::rom::cannot_open(loc);
    return std::nullopt;
  }

  std::vector<std::uint8_t> bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
  if(bytes.empty())
  {
    diagnostic <<= diagnostic_db::rom::empty(loc);
    return std::nullopt;
  }
  if(load_address > memory_size || bytes.size() > memory_size - load_address)
  {
    diagnostic <<= diagnostic_db::rom::too_large(loc, bytes.size(), load_address);
    return std::nullopt;
  }
  if(bytes.size() % 2 != 0)
    diagnostic <<= diagnostic_db::rom::odd_size(rom_location(path, load_address + bytes.size() - 1));

  return bytes;
}

}
