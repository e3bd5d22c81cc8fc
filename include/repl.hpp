#pragma once

#include <config.hpp>
#include <vm.hpp>

#include <iostream>
#include <cstdio>
#include <string>
#include <vector>

/**
 * This REPL ("Read, Evaluate, Print"-Loop) is a small debugger for the
 * interpreter. Commands start with a quote, everything else is taken as
 * hex opcode words that get written at PC.
 */

template<typename repl>
struct base_repl
{
  void run()
  { static_cast<repl&>(*this).run_impl(); }

  void quit();
  void history();
  void write();

  std::vector<std::string> commands;

  bool stopped { false };
protected:
  base_repl(std::istream& in, std::FILE* out) : in(in), out(out)
  {  }

  std::istream& in;
  std::FILE* out;
};

namespace virt
{
  struct REPL : base_repl<REPL>
  {
    friend struct base_repl<REPL>; // <- allow base_repl to call run_impl
  public:
    REPL(const config_t& cfg, std::vector<std::uint8_t> rom, std::string module,
         std::istream& in = std::cin, std::FILE* out = stdout);

    void process_command(const std::string& str);

    const c8::vm& machine() const { return virt_mach; }
  private:
    void run_impl();

    std::vector<std::uint16_t> parse_hex(const std::string& str);

    c8::vm make_machine() const;

    void program();
    void registers();
    void load();
    void step(std::size_t count);
    void key(const std::string& arg, bool pressed);
    void set_pc(const std::string& arg);
    void flush_diagnostics();
  private:
    config_t cfg;
    std::vector<std::uint8_t> rom;
    std::string module;

    c8::vm virt_mach;

    std::size_t failed_inputs { 0 };
  };
}
