#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic.hpp>
#include <rom_reader.hpp>

#include <cstdio>
#include <fstream>
#include <string>

namespace
{
  const std::string rom_path = "c8vm_rom_reader_test.ch8";

  void write_rom(const std::vector<std::uint8_t>& bytes)
  {
    std::ofstream file(rom_path, std::ios::out | std::ios::binary | std::ios::trunc);
    file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
  }
}

TEST_CASE( "reading ROM files", "[rom]" ) {

  diagnostic.reset();

  SECTION( "whole file" ) {
    write_rom({ 0x62, 0x22, 0x60, 0x15 });

    const auto rom = rom_reader::read(rom_path, 0x200, 4096);

    REQUIRE(rom.has_value());
    REQUIRE(*rom == std::vector<std::uint8_t>{ 0x62, 0x22, 0x60, 0x15 });
    REQUIRE(diagnostic.empty());
  }

  SECTION( "missing file" ) {
    const auto rom = rom_reader::read("no/such/dir/rom.ch8", 0x200, 4096);

    REQUIRE_FALSE(rom.has_value());
    REQUIRE(diagnostic.has(200));
    REQUIRE(diagnostic.error_code() != 0);
  }

  SECTION( "empty file" ) {
    write_rom({ });

    const auto rom = rom_reader::read(rom_path, 0x200, 4096);

    REQUIRE_FALSE(rom.has_value());
    REQUIRE(diagnostic.has(201));
  }

  SECTION( "too large for memory" ) {
    write_rom(std::vector<std::uint8_t>(4096 - 0x200 + 1, 0x00));

    REQUIRE_FALSE(rom_reader::read(rom_path, 0x200, 4096).has_value());
    REQUIRE(diagnostic.has(202));

    diagnostic.reset();
    REQUIRE(rom_reader::read(rom_path, 0x1FF, 4096).has_value());
    REQUIRE_FALSE(diagnostic.has(202));
  }

  SECTION( "odd size only warns" ) {
    write_rom({ 0x62, 0x22, 0x60 });

    const auto rom = rom_reader::read(rom_path, 0x200, 4096);

    REQUIRE(rom.has_value());
    REQUIRE(rom->size() == 3);
    REQUIRE(diagnostic.has(203));
    REQUIRE(diagnostic.error_code() == 0);
  }

  std::remove(rom_path.c_str());
  diagnostic.reset();
}
