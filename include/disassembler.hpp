#pragma once

#include <vm_opcodes.hpp>

#include <cstdint>
#include <cstdio>
#include <string>
#include <vector>

namespace c8
{

/// Mnemonic for a single instruction, e.g. "DRW V0, V1, 0x5". Words that do
/// not decode print as "DW 0xNNNN".
std::string disassemble(const instruction& in);

inline std::string disassemble(std::uint16_t word)
{ return disassemble(instruction(word)); }

/// One line per word: address, word and mnemonic. `begin` is the address of
/// the first word in `code`.
void print_listing(std::FILE* f, const std::vector<std::uint16_t>& code, std::uint32_t begin,
                   std::uint32_t marker = 0xFFFFFFFF);

}
