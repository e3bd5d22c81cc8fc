#define CATCH_CONFIG_MAIN
#include <catch2/catch.hpp>

#include <diagnostic.hpp>
#include <config.hpp>
#include <repl.hpp>

#include <sstream>
#include <cstdio>

namespace
{
  config_t repl_config()
  {
    config_t cfg;
    cfg.seed = 5489;
    return cfg;
  }

  struct sink
  {
    sink() : f(std::tmpfile())  {  }
    ~sink() { if(f != nullptr) std::fclose(f); }

    std::FILE* get() const
    { return f != nullptr ? f : stdout; }

    std::FILE* f;
  };
}

TEST_CASE( "debugger commands", "[repl]" ) {

  diagnostic.reset();

  sink out;
  std::istringstream in;
  virt::REPL repl(repl_config(), { 0x62, 0x22, 0x60, 0x15 }, "test.ch8", in, out.get());

  SECTION( "stepping" ) {
    repl.process_command("'next");
    REQUIRE(repl.machine().registers().v[2] == 0x22);
    REQUIRE(repl.machine().registers().pc == 0x202);

    repl.process_command("'run 1");
    REQUIRE(repl.machine().registers().v[0] == 0x15);
    REQUIRE(repl.commands.size() == 2);
  }

  SECTION( "hex words are written at PC" ) {
    repl.process_command("6A42 7A01");
    REQUIRE(repl.machine().memory().read_u16(0x200) == 0x6A42);
    REQUIRE(repl.machine().memory().read_u16(0x202) == 0x7A01);

    repl.process_command("'run 2");
    REQUIRE(repl.machine().registers().v[0xA] == 0x43);
  }

  SECTION( "keys, pc and reset" ) {
    repl.process_command("'press c");
    REQUIRE(repl.machine().keys()[0xC]);
    repl.process_command("'release c");
    REQUIRE_FALSE(repl.machine().keys()[0xC]);

    repl.process_command("'pc 300");
    REQUIRE(repl.machine().registers().pc == 0x300);

    repl.process_command("'next");
    repl.process_command("'reset");
    REQUIRE(repl.machine().registers().pc == 0x200);
    REQUIRE(repl.machine().memory().read_u16(0x200) == 0x6222);
  }

  SECTION( "faults do not leave the debugger" ) {
    repl.process_command("00EE");
    repl.process_command("'next");
    REQUIRE(repl.machine().registers().pc == 0x200);
    REQUIRE_FALSE(repl.stopped);

    // printed right away but still decides the exit status
    REQUIRE(diagnostic.empty());
    REQUIRE(diagnostic.error_code() != 0);
  }

  SECTION( "malformed key and address arguments" ) {
    repl.process_command("'press zz");
    REQUIRE_FALSE(repl.machine().keys()[0]);
    repl.process_command("'press 1x");
    REQUIRE_FALSE(repl.machine().keys()[1]);
    repl.process_command("'press 10");
    REQUIRE(diagnostic.error_code() != 0);

    repl.process_command("'pc 3g0");
    REQUIRE(repl.machine().registers().pc == 0x200);
    repl.process_command("'pc");
    REQUIRE(repl.machine().registers().pc == 0x200);
  }

  SECTION( "invalid input" ) {
    repl.process_command("hello world");
    REQUIRE(repl.machine().memory().read_u16(0x200) == 0x6222);
    REQUIRE_FALSE(repl.stopped);
  }

  SECTION( "quit" ) {
    repl.process_command("'quit");
    REQUIRE(repl.stopped);
  }

  diagnostic.reset();
}

TEST_CASE( "debugger loop", "[repl]" ) {

  diagnostic.reset();

  sink out;
  std::istringstream in("'next\n'registers\n'program\n'frame\n'tick\n'quit\n");
  virt::REPL repl(repl_config(), { 0x62, 0x22 }, "test.ch8", in, out.get());

  repl.run();

  REQUIRE(repl.stopped);
  REQUIRE(repl.commands.size() == 6);
  REQUIRE(repl.machine().registers().v[2] == 0x22);
}
