#include <diagnostic.hpp>

#include <fmt/color.h>

#include <algorithm>
#include <iterator>
#include <cassert>

namespace mk_diag
{

static nlohmann::json make(diag_level level, const rom_location& loc,
                           std::uint_fast16_t code, const std::string_view& message)
{
  nlohmann::json j;

  j["location"] = loc;

  j["level"] = level;

  j["code"] = code;
  j["message"] = message;

  return j;
}

nlohmann::json warn(const rom_location& loc,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::warn, loc, code, message); }

nlohmann::json error(const rom_location& loc,
                     std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::error, loc, code, message); }

nlohmann::json info(const rom_location& loc,
                    std::uint_fast16_t code, const std::string_view& message)
{ return make(diag_level::info, loc, code, message); }

}

diagnostics_manager::~diagnostics_manager()
{
#ifndef C8VM_TESTING
  assert(printed && "Messages have been printed.");
#endif
}

diagnostics_manager& diagnostics_manager::operator<<=(const nlohmann::json& msg)
{
  std::lock_guard<std::mutex> guard(mut);

  if(msg["level"].get<diag_level>() == diag_level::error)
    err = 1;

  const auto& module = msg["location"]["module"].get_ref<const std::string&>();
  auto it = std::find_if(modules.begin(), modules.end(), [&module](const auto& m) { return *m == module; });
  if(it == modules.end())
  {
    modules.push_back(std::make_unique<std::string>(module));
    it = std::prev(modules.end());
  }

  const rom_location loc(**it, msg["location"]["address"].get<std::uint32_t>());
  auto& bucket = data[loc];
  if(bucket.empty())
    order.push_back(loc);
  bucket.push_back(msg);

  printed = false;
  return *this;
}

std::size_t diagnostics_manager::size() const
{
  std::lock_guard<std::mutex> guard(mut);

  std::size_t count = 0;
  for(auto& w : data)
    count += w.second.size();
  return count;
}

bool diagnostics_manager::has(std::uint_fast16_t code) const
{
  std::lock_guard<std::mutex> guard(mut);

  for(auto& w : data)
  {
    for(auto& v : w.second)
    {
      if(v["code"].get<std::uint_fast16_t>() == code)
        return true;
    }
  }
  return false;
}

void diagnostics_manager::print(std::FILE* file)
{
  std::lock_guard<std::mutex> guard(mut);
  if(printed)
    return;

  for(auto& loc : order)
  {
    for(auto& v : data[loc])
    {
      fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}: ", loc.to_string());

      const auto code = v["code"].get<std::uint_fast16_t>();
      const auto& message = v["message"].get_ref<const std::string&>();

      switch(v["level"].get<diag_level>())
      {
      default:
      case diag_level::error:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(C8-{}) ", code);
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::red), "error: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", message);
        } break;

      case diag_level::info:
        {
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::gray), "info: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", message);
        } break;

      case diag_level::warn:
        {
          fmt::print(file, fg(fmt::color::cornsilk), "(C8-{}) ", code);
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::alice_blue), "warning: ");
          fmt::print(file, fmt::emphasis::bold | fg(fmt::color::white), "{}", message);
        } break;
      }
      fmt::print(file, fg(fmt::color::white), "\n");
    }
  }
  data.clear();
  order.clear();
  printed = true;
}

int diagnostics_manager::error_code() const
{
  return err;
}
