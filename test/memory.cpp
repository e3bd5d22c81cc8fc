#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <memory.hpp>
#include <registers.hpp>
#include <vm_fault.hpp>

#include <algorithm>

using namespace c8;

TEST_CASE( "ram", "[memory]" ) {

  ram mem;

  SECTION( "zeroed" ) {
    REQUIRE(mem.size() == 4096);
    REQUIRE((std::all_of(mem.bytes().begin(), mem.bytes().end(), [](auto b) { return b == 0; })));
  }

  SECTION( "bytes" ) {
    mem.write_u8(0x300, 0xAB);
    REQUIRE(mem.read_u8(0x300) == 0xAB);
    mem.write_u8(0xFFF, 0x01);
    REQUIRE(mem.read_u8(0xFFF) == 0x01);
  }

  SECTION( "words are big-endian" ) {
    mem.write_u16(0x200, 0x6222);
    REQUIRE(mem.read_u8(0x200) == 0x62);
    REQUIRE(mem.read_u8(0x201) == 0x22);
    REQUIRE(mem.read_u16(0x200) == 0x6222);
  }

  SECTION( "load_block" ) {
    REQUIRE(mem.load_block(0x200, std::vector<std::uint16_t>{ 0x6222, 0x6015 }) == 0x204);
    REQUIRE(mem.read_u16(0x202) == 0x6015);

    REQUIRE(mem.load_block(0x300, std::vector<std::uint8_t>{ 1, 2, 3 }) == 0x303);
    REQUIRE(mem.read_u8(0x302) == 3);

    REQUIRE(mem.load_block(0x400, std::vector<std::uint8_t>{ }) == 0x400);
  }

  SECTION( "out of range" ) {
    REQUIRE_THROWS_AS(mem.read_u8(0x1000), vm_fault);
    REQUIRE_THROWS_AS(mem.write_u8(0x1000, 1), vm_fault);
    REQUIRE_THROWS_AS(mem.read_u16(0xFFF), vm_fault);
    REQUIRE_THROWS_AS(mem.write_u16(0xFFF, 1), vm_fault);

    try
    {
      mem.read_u8(0x1234);
      FAIL("no fault");
    }
    catch(const vm_fault& fault)
    {
      REQUIRE(fault.kind == fault_kind::address_out_of_range);
      REQUIRE(fault.address == 0x1234);
    }
  }

  SECTION( "load_block is all or nothing" ) {
    REQUIRE_THROWS_AS(mem.load_block(0xFFE, std::vector<std::uint8_t>{ 1, 2, 3 }), vm_fault);
    REQUIRE(mem.read_u8(0xFFE) == 0);
    REQUIRE(mem.read_u8(0xFFF) == 0);

    REQUIRE_THROWS_AS(mem.load_block(0xFFC, std::vector<std::uint16_t>{ 0x1111, 0x2222, 0x3333 }), vm_fault);
    REQUIRE(mem.read_u16(0xFFC) == 0);
  }
}

TEST_CASE( "call stack", "[memory]" ) {

  call_stack calls;
  std::uint8_t sp = 0;

  SECTION( "lifo" ) {
    calls.push(sp, 0x202);
    calls.push(sp, 0x402);
    REQUIRE(sp == 2);
    REQUIRE(calls[0] == 0x202);
    REQUIRE(calls.pop(sp) == 0x402);
    REQUIRE(calls.pop(sp) == 0x202);
    REQUIRE(sp == 0);
  }

  SECTION( "overflow" ) {
    for(std::size_t k = 0; k < call_stack::capacity; ++k)
      calls.push(sp, 0x200);
    REQUIRE(sp == 16);
    REQUIRE_THROWS_AS(calls.push(sp, 0x200), vm_fault);
    REQUIRE(sp == 16);
  }

  SECTION( "underflow" ) {
    REQUIRE_THROWS_AS(calls.pop(sp), vm_fault);
    REQUIRE(sp == 0);
  }
}
