#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rom_reader
{

/**
 * Reads the whole file into memory. Reports problems to `diagnostic`:
 * unreadable, empty and oversized files yield std::nullopt, an odd byte
 * count only warns.
 *
 * @param path file to read
 * @param load_address where the image is going to be loaded
 * @param memory_size capacity of the machine's memory
 */
std::optional<std::vector<std::uint8_t>> read(const std::string& path, std::uint32_t load_address,
                                              std::size_t memory_size);

}
