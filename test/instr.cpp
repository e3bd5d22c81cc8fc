#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <vm_opcodes.hpp>

using namespace c8;

TEST_CASE( "instruction fields", "[decode]" ) {

  constexpr instruction in(0xD125);

  REQUIRE(in.opcode == 0xD125);
  REQUIRE(in.c == 0xD);
  REQUIRE(in.x == 0x1);
  REQUIRE(in.y == 0x2);
  REQUIRE(in.n == 0x5);
  REQUIRE(in.nn == 0x25);
  REQUIRE(in.nnn == 0x125);

  static_assert(instruction(0xA2F0).nnn == 0x2F0);
  static_assert(classify(instruction(0x00E0)) == op_code::CLS);
}

TEST_CASE( "every word decodes", "[decode]" ) {

  std::size_t mismatches = 0;
  for(std::uint32_t w = 0; w <= 0xFFFF; ++w)
  {
    const instruction in(static_cast<std::uint16_t>(w));
    const bool ok = in.opcode == w
                 && in.c == ((w >> 12) & 0xF)
                 && in.x == ((w >> 8) & 0xF)
                 && in.y == ((w >> 4) & 0xF)
                 && in.n == (w & 0xF)
                 && in.nn == (w & 0xFF)
                 && in.nnn == (w & 0xFFF);
    if(!ok)
      ++mismatches;
  }
  REQUIRE(mismatches == 0);
}

TEST_CASE( "classify", "[decode]" ) {

  SECTION( "class 0" ) {
    REQUIRE(classify(instruction(0x00E0)) == op_code::CLS);
    REQUIRE(classify(instruction(0x00EE)) == op_code::RET);
    REQUIRE(classify(instruction(0x0123)) == op_code::UNKNOWN);
    REQUIRE(classify(instruction(0x0000)) == op_code::UNKNOWN);
  }

  SECTION( "flow and immediates" ) {
    REQUIRE(classify(instruction(0x1320)) == op_code::JP);
    REQUIRE(classify(instruction(0x2400)) == op_code::CALL);
    REQUIRE(classify(instruction(0x3A22)) == op_code::SE_IMM);
    REQUIRE(classify(instruction(0x4A22)) == op_code::SNE_IMM);
    REQUIRE(classify(instruction(0x6222)) == op_code::LD_IMM);
    REQUIRE(classify(instruction(0x7201)) == op_code::ADD_IMM);
    REQUIRE(classify(instruction(0xA2F0)) == op_code::LD_I);
    REQUIRE(classify(instruction(0xB300)) == op_code::JP_V0);
    REQUIRE(classify(instruction(0xC0FF)) == op_code::RND);
    REQUIRE(classify(instruction(0xD015)) == op_code::DRW);
  }

  SECTION( "register compares need a zero low nibble" ) {
    REQUIRE(classify(instruction(0x5120)) == op_code::SE_REG);
    REQUIRE(classify(instruction(0x5121)) == op_code::UNKNOWN);
    REQUIRE(classify(instruction(0x9120)) == op_code::SNE_REG);
    REQUIRE(classify(instruction(0x912F)) == op_code::UNKNOWN);
  }

  SECTION( "class 8" ) {
    REQUIRE(classify(instruction(0x8230)) == op_code::LD_REG);
    REQUIRE(classify(instruction(0x8231)) == op_code::OR);
    REQUIRE(classify(instruction(0x8232)) == op_code::AND);
    REQUIRE(classify(instruction(0x8233)) == op_code::XOR);
    REQUIRE(classify(instruction(0x8234)) == op_code::ADD_REG);
    REQUIRE(classify(instruction(0x8235)) == op_code::SUB);
    REQUIRE(classify(instruction(0x8236)) == op_code::SHR);
    REQUIRE(classify(instruction(0x8237)) == op_code::SUBN);
    REQUIRE(classify(instruction(0x823E)) == op_code::SHL);
    REQUIRE(classify(instruction(0x8238)) == op_code::UNKNOWN);
    REQUIRE(classify(instruction(0x823F)) == op_code::UNKNOWN);
  }

  SECTION( "class E and F" ) {
    REQUIRE(classify(instruction(0xE19E)) == op_code::SKP);
    REQUIRE(classify(instruction(0xE1A1)) == op_code::SKNP);
    REQUIRE(classify(instruction(0xE100)) == op_code::UNKNOWN);

    REQUIRE(classify(instruction(0xF107)) == op_code::LD_VX_DT);
    REQUIRE(classify(instruction(0xF10A)) == op_code::LD_VX_K);
    REQUIRE(classify(instruction(0xF115)) == op_code::LD_DT_VX);
    REQUIRE(classify(instruction(0xF118)) == op_code::LD_ST_VX);
    REQUIRE(classify(instruction(0xF11E)) == op_code::ADD_I_VX);
    REQUIRE(classify(instruction(0xF129)) == op_code::LD_F_VX);
    REQUIRE(classify(instruction(0xF133)) == op_code::LD_B_VX);
    REQUIRE(classify(instruction(0xF155)) == op_code::LD_MEM_VX);
    REQUIRE(classify(instruction(0xF165)) == op_code::LD_VX_MEM);
    REQUIRE(classify(instruction(0xF1FF)) == op_code::UNKNOWN);
  }
}
