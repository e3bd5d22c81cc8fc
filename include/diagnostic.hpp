#pragma once

#include <rom_location.hpp>

#include <nlohmann/json.hpp>
#include <tsl/robin_map.h>
#include <fmt/format.h>

#include <string_view>
#include <functional>
#include <cstdio>
#include <memory>
#include <string>
#include <vector>
#include <mutex>

enum class diag_level : unsigned char
{
  error = 1,
  info  = 1 << 1,
  warn  = 1 << 2,
};

NLOHMANN_JSON_SERIALIZE_ENUM( diag_level, {
  { diag_level::error, "error" },
  { diag_level::info, "info" },
  { diag_level::warn, "warn" },
})

namespace mk_diag
{
nlohmann::json error(const rom_location& loc,
                     std::uint_fast16_t code, const std::string_view& message);

nlohmann::json warn(const rom_location& loc,
                    std::uint_fast16_t code, const std::string_view& message);

nlohmann::json info(const rom_location& loc,
                    std::uint_fast16_t code, const std::string_view& message);
}

namespace std
{
  template<>
  struct hash<::rom_location>
  {
    std::size_t operator()(const ::rom_location& l) const
    {
      return std::hash<std::string_view>()(l.module) ^ (std::hash<std::uint32_t>()(l.address) << 1);
    }
  };
}

struct diagnostics_manager
{
private:
  diagnostics_manager()  {  }
public:
  ~diagnostics_manager();

  static diagnostics_manager& make()
  {
    static diagnostics_manager diag;
    return diag;
  }

  diagnostics_manager& operator<<=(const nlohmann::json& msg);

  bool empty() const { return order.empty(); }
  std::size_t size() const;

  bool has(std::uint_fast16_t code) const;

  void print(std::FILE* file);
  int error_code() const;

  inline void reset() { err = 0; data.clear(); order.clear(); modules.clear(); printed = true; }
private:
  // locations keep a view on the module name, so the names live here
  std::vector<std::unique_ptr<std::string>> modules;

  tsl::robin_map<rom_location, std::vector<nlohmann::json>> data;
  std::vector<rom_location> order;

  int err { 0 };
  mutable std::mutex mut;

  bool printed { true };
};

inline diagnostics_manager& diagnostic = diagnostics_manager::make();
