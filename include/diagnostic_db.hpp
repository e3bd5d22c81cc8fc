#pragma once

#include <diagnostic.hpp>

#include <fmt/format.h>

namespace diagnostic_db
{

#define db_entry(lv, name, code, txt) static const auto name = [](const rom_location& loc) \
{ return mk_diag::lv(loc, code, txt); }

#define db_entry_arg(lv, name, code, txt) static const auto name = [](const rom_location& loc, auto t) \
{ return mk_diag::lv(loc, code, fmt::format(FMT_STRING(txt), t)); }

#define db_entry_arg2(lv, name, code, txt) static const auto name = [](const rom_location& loc, auto t1, auto t2) \
{ return mk_diag::lv(loc, code, fmt::format(FMT_STRING(txt), t1, t2)); }

namespace args
{

db_entry_arg(error, unknown_arg, 100, "Unknown command line argument \"{}\".");
db_entry_arg(error, emit_not_present, 101, "Emit class \"{}\" is unknown!");
db_entry_arg(error, profile_not_present, 102, "Profile \"{}\" is unknown, expected \"original\" or \"modern\".");
db_entry_arg(error, not_a_number, 103, "\"{}\" is not a number.");
db_entry(error, cycles_per_frame_zero, 104, "Number of cycles per frame must be at least one.");
db_entry_arg(error, missing_value, 105, "Option \"{}\" expects a value.");
db_entry_arg(warn, load_address_unusual, 106, "Load address {:#x} overlaps the digit sprites.");

}

namespace rom
{

db_entry(error, cannot_open, 200, "Cannot open ROM file.");
db_entry(error, empty, 201, "ROM file is empty.");
db_entry_arg2(error, too_large, 202, "ROM of {} bytes does not fit into memory at {:#x}.");
db_entry(warn, odd_size, 203, "ROM has an odd number of bytes, the last byte is ignored.");

}

namespace vm
{

db_entry_arg(error, unknown_opcode, 300, "Unknown opcode {:#06x}.");
db_entry_arg(error, address_out_of_range, 301, "Memory access at {:#x} is out of range.");
db_entry(error, stack_overflow, 302, "Call stack overflow.");
db_entry(error, stack_underflow, 303, "Return with an empty call stack.");
db_entry_arg(error, key_out_of_range, 304, "Key {} is not on the keypad (0-F).");
db_entry_arg(info, halted, 305, "Execution stopped after {} cycles.");

}

#undef db_entry
#undef db_entry_arg
#undef db_entry_arg2

}
