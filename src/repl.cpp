#include <repl.hpp>
#include <runner.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <disassembler.hpp>

#include <fmt/format.h>

#include <algorithm>
#include <iterator>
#include <cstdlib>
#include <optional>
#include <fstream>
#include <sstream>

namespace
{

bool prompt_yes_no(std::istream& in)
{
  std::string answer;
  do
  {
    if(!std::getline(in, answer))
      return false;
  }
  while(!(answer == "Y" || answer == "y" || answer.empty() || answer == "yes" || answer == "YES"
     || answer == "Yes" || answer == "n" || answer == "N"  || answer == "no"  || answer == "No"
     || answer == "NO"));

  return answer == "Y"   || answer == "y"   || answer.empty()
      || answer == "yes" || answer == "YES" || answer == "Yes";
}

// whole argument as one hex number, nothing else
std::optional<unsigned long> parse_hex_arg(const std::string& arg)
{
  if(arg.empty())
    return std::nullopt;

  char* end = nullptr;
  const unsigned long value = std::strtoul(arg.c_str(), &end, 16);
  if(end != arg.c_str() + arg.size())
    return std::nullopt;
  return value;
}

}


template<typename T>
void base_repl<T>::quit()
{ stopped = true; }

template<typename T>
void base_repl<T>::history()
{
  for(const auto& cmd : commands)
    fmt::print(out, "{}\n", cmd);
}

template<typename T>
void base_repl<T>::write()
{
  fmt::print(out, "File: ");

  std::string filepath;
  std::getline(in, filepath);

  if(filepath.empty())
    return;

  fmt::print(out, "\nStore REPL commands? Y/n: ");
  const bool store_cmds = prompt_yes_no(in);

  std::fstream file(filepath, std::ios::out);
  for(const auto& str : commands)
  {
    if(str.empty() || (!store_cmds && str.front() == '\''))
      continue;

    file << str << "\n";
  }

  fmt::print(out, "\nState written to \"{}\".\n", filepath);
}

template struct base_repl<virt::REPL>;


namespace virt
{
  REPL::REPL(const config_t& cfg, std::vector<std::uint8_t> rom, std::string module, std::istream& in, std::FILE* out)
    : base_repl(in, out), cfg(cfg), rom(std::move(rom)), module(std::move(module)), virt_mach(make_machine())
  {  }

  c8::vm REPL::make_machine() const
  {
    const auto profile = c8::quirk_profile::from_name(cfg.profile);
    c8::vm mach = cfg.seed ? c8::vm(profile, *cfg.seed) : c8::vm(profile);

    if(!rom.empty())
      mach.load_rom(rom, cfg.load_address);
    mach.set_pc(cfg.load_address);
    if(cfg.trace)
      mach.set_trace(stderr);
    return mach;
  }

  void REPL::run_impl()
  {
    fmt::print(out, ">> Welcome to c8vm. Happy Hacking!\n");

    while(!stopped)
    {
      fmt::print(out, "(c8) > ");

      std::string line;
      std::getline(in, line);

      process_command(line);
    }
  }

  std::vector<std::uint16_t> REPL::parse_hex(const std::string& line)
  {
    std::vector<std::uint16_t> data;

    std::stringstream ss(line);
    do
    {
      std::string buf;
      std::getline(ss, buf, ' ');

      if(buf.empty())
        continue;

      std::size_t pos = 0;
      unsigned long word = 0;
      try
      { word = std::stoul(buf, &pos, 16); }
      catch(const std::exception&)
      { return {}; }

      if(pos != buf.size() || word > 0xFFFF)
        return {};
      data.emplace_back(static_cast<std::uint16_t>(word));
    }
    while(!(ss.eof()));

    return data;
  }

  void REPL::flush_diagnostics()
  {
    // drains the queue, the error status is kept for the exit code
    if(!diagnostic.empty())
      diagnostic.print(out);
  }

  void REPL::process_command(const std::string& line)
  {
    const auto space = line.find(' ');
    const std::string cmd = line.substr(0, space);
    const std::string arg = space == std::string::npos ? "" : line.substr(space + 1);

    if(cmd == "'quit" || (line.empty() && in.eof()))
      quit();
    else if(cmd == "'history")
      history();
    else if(cmd == "'program")
      program();
    else if(cmd == "'registers")
      registers();
    else if(cmd == "'next")
      step(1);
    else if(cmd == "'run")
    {
      const auto n = arg.empty() ? 1UL : std::strtoul(arg.c_str(), nullptr, 0);
      step(n);
    }
    else if(cmd == "'tick")
      virt_mach.cycle_timers();
    else if(cmd == "'frame")
      c8::print_frame(out, virt_mach.get_frame());
    else if(cmd == "'press")
      key(arg, true);
    else if(cmd == "'release")
      key(arg, false);
    else if(cmd == "'pc")
      set_pc(arg);
    else if(cmd == "'reset")
      virt_mach = make_machine();
    else if(cmd == "'write")
      write();
    else if(cmd == "'load")
      load();
    else
    {
      const auto words = parse_hex(line);

      if(words.empty())
      {
        fmt::print(out, "Invalid command.\n");

        if(failed_inputs++ > 1)
          fmt::print(out, "Type \"'quit\" or hit Ctrl-D to quit.\n");
      }
      else
      {
        try
        { virt_mach.memory().load_block(virt_mach.registers().pc, words); }
        catch(const c8::vm_fault& fault)
        { host::report(fault, "repl"); }
      }
    }
    flush_diagnostics();
    commands.emplace_back(line);
  }

  void REPL::step(std::size_t count)
  {
    for(std::size_t i = 0; i < count; ++i)
    {
      try
      { virt_mach.cycle(); }
      catch(const c8::vm_fault& fault)
      {
        host::report(fault, module);
        return;
      }
    }
  }

  void REPL::key(const std::string& arg, bool pressed)
  {
    const auto k = parse_hex_arg(arg);
    if(!k || *k >= c8::vm::key_count)
    {
      diagnostic <<= diagnostic_db::vm::key_out_of_range(rom_location { "repl", 0 }, arg);
      return;
    }
    if(pressed)
      virt_mach.key_press(static_cast<std::uint8_t>(*k));
    else
      virt_mach.key_unpress(static_cast<std::uint8_t>(*k));
  }

  void REPL::set_pc(const std::string& arg)
  {
    const auto addr = parse_hex_arg(arg);
    if(!addr || *addr > 0xFFFF)
    {
      diagnostic <<= diagnostic_db::args::not_a_number(rom_location { "repl", 0 }, arg);
      return;
    }
    virt_mach.set_pc(static_cast<std::uint16_t>(*addr));
  }

  void REPL::program()
  {
    const auto& mem = virt_mach.memory();
    const std::uint32_t pc = virt_mach.registers().pc;

    const std::uint32_t begin = pc >= 8 ? pc - 8 : pc % 2;
    const std::uint32_t end = std::min<std::uint32_t>(pc + 16, static_cast<std::uint32_t>(mem.size()));

    std::vector<std::uint16_t> words;
    for(std::uint32_t addr = begin; addr + 1 < end; addr += 2)
      words.push_back(mem.read_u16(addr));

    c8::print_listing(out, words, begin, pc);
  }

  void REPL::registers()
  {
    const auto& regs = virt_mach.registers();

    fmt::print(out, "V: [{:02X}", regs.v.front());
    for(auto it = std::next(regs.v.begin()); it != regs.v.end(); ++it)
      fmt::print(out, " {:02X}", *it);
    fmt::print(out, "]\n");

    fmt::print(out, "I={:04X} PC={:04X} SP={} DT={} ST={}\n", regs.i, regs.pc, regs.sp, regs.dt, regs.st);
  }

  void REPL::load()
  {
    fmt::print(out, "File: ");

    std::string filepath;
    std::getline(in, filepath);

    if(filepath.empty())
      return;

    std::fstream file(filepath, std::ios::in);
    for(std::string line; std::getline(file, line); process_command(line))
      ;
    fmt::print(out, "\nState loaded from \"{}\".\n", filepath);
  }
}
