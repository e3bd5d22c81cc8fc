#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <disassembler.hpp>
#include <diagnostic.hpp>
#include <rom_reader.hpp>
#include <config.hpp>
#include <runner.hpp>
#include <repl.hpp>
#include <vm.hpp>

#include <optional>

namespace
{

std::vector<std::uint16_t> to_words(const std::vector<std::uint8_t>& bytes)
{
  std::vector<std::uint16_t> words;
  words.reserve(bytes.size() / 2);
  for(std::size_t i = 0; i + 1 < bytes.size(); i += 2)
    words.push_back(static_cast<std::uint16_t>((bytes[i] << 8) | bytes[i + 1]));
  return words;
}

c8::vm make_machine(const std::vector<std::uint8_t>& rom)
{
  const auto profile = c8::quirk_profile::from_name(config.profile);
  c8::vm mach = config.seed ? c8::vm(profile, *config.seed) : c8::vm(profile);

  mach.load_rom(rom, config.load_address);
  mach.set_pc(config.load_address);
  if(config.trace)
    mach.set_trace(stderr);
  return mach;
}

}

int main(int argc, const char** argv)
{
  arguments::parse(argc, argv, stdout);

  if(diagnostic.error_code() != 0)
    goto end;
  if(config.print_help)
    goto end;

  { // <- needed for goto
  const std::optional<std::vector<std::uint8_t>> rom = rom_reader::read(config.rom, config.load_address, 4096);
  if(!rom)
    goto end;

  switch(config.emit_class)
  {
  case emit_classes::disasm:
    c8::print_listing(stdout, to_words(*rom), config.load_address);
    break;

  case emit_classes::repl:
    {
      virt::REPL repl(config, *rom, config.rom);
      repl.run();
    } break;

  default:
  case emit_classes::run:
    {
      try
      {
        c8::vm mach = make_machine(*rom);

        const auto stats = host::run_headless(mach, config, config.rom);
        if(!stats.faulted)
          diagnostic <<= diagnostic_db::vm::halted(rom_location(config.rom, mach.registers().pc), stats.cycles);

        c8::print_frame(stdout, mach.get_frame());
        host::print_stats(stdout, stats);
      }
      catch(const c8::vm_fault& fault)
      {
        host::report(fault, config.rom);
      }
    } break;
  }
  }

end:
  diagnostic.print(stdout);
  return diagnostic.error_code();
}
