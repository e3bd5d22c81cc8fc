#pragma once

#include <nlohmann/json.hpp>

namespace c8
{

enum class profile_name
{
  undef,
  original,
  modern,
};

NLOHMANN_JSON_SERIALIZE_ENUM( profile_name, {
  { profile_name::undef, "undef" },
  { profile_name::original, "original" },
  { profile_name::modern, "modern" },
})

/**
 * Behaviour of the instructions that historic and contemporary interpreters
 * disagree on. Only 8xy6, 8xyE, Fx55 and Fx65 look at it.
 */
struct quirk_profile
{
  bool shr_copies_vy { false };
  bool shl_copies_vy { false };
  bool store_dump_advances_i { false };
  bool store_load_advances_i { false };

  static constexpr quirk_profile original()
  { return quirk_profile { true, true, true, true }; }

  static constexpr quirk_profile modern()
  { return quirk_profile { false, false, false, false }; }

  static quirk_profile from_name(profile_name name)
  { return name == profile_name::original ? original() : modern(); }
};

inline bool operator==(const quirk_profile& lhs, const quirk_profile& rhs)
{
  return lhs.shr_copies_vy == rhs.shr_copies_vy && lhs.shl_copies_vy == rhs.shl_copies_vy
      && lhs.store_dump_advances_i == rhs.store_dump_advances_i
      && lhs.store_load_advances_i == rhs.store_load_advances_i;
}

}
