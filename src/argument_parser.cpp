#include <arguments_parser.hpp>
#include <diagnostic_db.hpp>
#include <diagnostic.hpp>
#include <config.hpp>

#include <fmt/format.h>

#include <iterator>
#include <optional>
#include <limits>

using namespace std::string_view_literals;

void print_emit_classes(std::FILE* f)
{
  fmt::print(f, "emit classes: ");

  for(auto it = std::begin(emit_classes_list); it != std::end(emit_classes_list); ++it)
  {
    if(std::next(it) == std::end(emit_classes_list))
      fmt::print(f, "{}\n", nlohmann::json(*it).get<std::string>());
    else
      fmt::print(f, "{}, ", nlohmann::json(*it).get<std::string>());
  }
}

namespace arguments
{

namespace
{
  const rom_location args_loc { "args", 0 };

  std::optional<std::uint64_t> parse_number(std::string_view v, std::uint64_t max)
  {
    std::uint64_t num = 0;
    std::size_t pos = 0;
    try
    { num = std::stoull(std::string(v), &pos, 0); }
    catch(const std::exception&)
    { pos = 0; }

    if(pos == 0 || pos != v.size() || num > max)
    {
      diagnostic <<= diagnostic_db::args::not_a_number(args_loc, v);
      return std::nullopt;
    }
    return num;
  }
}

void parse(int argc, const char** argv, std::FILE* out)
{
  detail::CmdOptions options("c8vm", "An interpreter for the CHIP-8 virtual machine.");
  options.add_options()
    ("h,?,-help", "Prints this text.", std::make_any<bool>(false), "false",
      [](auto) -> std::any { return true; })
    (",r=,-rom=", "ROM image to load.", std::make_any<std::string>(config_t{}.rom), "rom/tests/ibm.ch8",
      [](auto x) -> std::any { return std::string(x.front()); })
    ("p=,-profile=", "Instruction quirks, \"original\" or \"modern\".", std::make_any<c8::profile_name>(c8::profile_name::modern), "modern",
      [](auto x) -> std::any
      {
        nlohmann::json easy_conversion = std::string(x.front());
        if(auto p = easy_conversion.get<c8::profile_name>(); p != c8::profile_name::undef)
          return p;

        diagnostic <<= diagnostic_db::args::profile_not_present(args_loc, x.front());
        return c8::profile_name::modern;
      })
    ("-emit=", "Choose what to emit. Set to \"help\" to get a list.", std::make_any<emit_classes>(emit_classes::run), "run",
      [](auto x) -> std::any
      {
        auto& v = x.front();

        if(v.empty()) return emit_classes::help;

        nlohmann::json easy_conversion = std::string(v);
        if(easy_conversion.get<emit_classes>() != emit_classes::undef)
          return easy_conversion.get<emit_classes>();

        diagnostic <<= diagnostic_db::args::emit_not_present(args_loc, v);
        return emit_classes::help;
      })
    ("s=,-seed=", "Seed of the random number generator.", std::make_any<std::optional<std::uint32_t>>(), "random",
      [](auto x) -> std::any
      {
        std::optional<std::uint32_t> seed;
        if(auto v = parse_number(x.front(), std::numeric_limits<std::uint32_t>::max()))
          seed = static_cast<std::uint32_t>(*v);
        return seed;
      })
    ("c=,-cycles=", "Number of cycles of a headless run.", std::make_any<std::size_t>(config_t{}.cycles), "5000",
      [](auto x) -> std::any
      {
        auto v = parse_number(x.front(), std::numeric_limits<std::size_t>::max());
        return static_cast<std::size_t>(v.value_or(config_t{}.cycles));
      })
    ("-cycles-per-frame=", "Cycles between two timer ticks.", std::make_any<std::size_t>(config_t{}.cycles_per_frame), "16",
      [](auto x) -> std::any
      {
        auto v = parse_number(x.front(), std::numeric_limits<std::size_t>::max());
        if(v && *v == 0)
        {
          diagnostic <<= diagnostic_db::args::cycles_per_frame_zero(args_loc);
          v = std::nullopt;
        }
        return static_cast<std::size_t>(v.value_or(config_t{}.cycles_per_frame));
      })
    ("-load-address=", "Address the ROM is loaded to and started from.", std::make_any<std::uint16_t>(config_t{}.load_address), "0x200",
      [](auto x) -> std::any
      {
        auto v = parse_number(x.front(), 0xFFF);
        if(v && *v < 0x50)
          diagnostic <<= diagnostic_db::args::load_address_unusual(args_loc, *v);
        return static_cast<std::uint16_t>(v.value_or(config_t{}.load_address));
      })
    ("t,-trace", "Trace every instruction to stderr.", std::make_any<bool>(false), "false",
      [](auto) -> std::any { return true; })
    ("f,-fast", "Run as fast as possible.", std::make_any<bool>(false), "false",
      [](auto) -> std::any { return true; })
    ;

  auto map = options.parse(argc, argv);

  config.print_help = false;
  if(std::any_cast<bool>(map["h"]))
  {
    options.print_help(out);
    config.print_help = true;
  }
  config.rom = std::any_cast<std::string>(map["r"]);
  config.profile = std::any_cast<c8::profile_name>(map["p"]);
  config.seed = std::any_cast<std::optional<std::uint32_t>>(map["s"]);
  config.cycles = std::any_cast<std::size_t>(map["c"]);
  config.cycles_per_frame = std::any_cast<std::size_t>(map["-cycles-per-frame"]);
  config.load_address = std::any_cast<std::uint16_t>(map["-load-address"]);
  config.trace = std::any_cast<bool>(map["t"]);
  config.fast = std::any_cast<bool>(map["f"]);
  config.emit_class = std::any_cast<emit_classes>(map["-emit"]);
  if(config.emit_class == emit_classes::help)
  {
    print_emit_classes(out);
    config.print_help = true;
  }
}

namespace detail
{

CmdOptions::CmdOptionsAdder& CmdOptions::CmdOptionsAdder::operator()(std::string_view opt_list, std::string_view description,
    std::any default_value, std::string_view default_value_str, const option_parser& f)
{
  bool has_equals = false;
  std::vector<std::string_view> opts;
  auto it = opt_list.find(',');
  while(it != std::string_view::npos)
  {
    std::string_view opt = opt_list.substr(0, it);
    opt_list.remove_prefix(it + 1); // + 1 to remove comma

    if(!opt.empty() && opt.back() == '=')
    {
      opt.remove_suffix(1); // <- get rid of equals
      has_equals = true;
    }
    opts.emplace_back(opt);
    it = opt_list.find(',');
  }
  if(!opt_list.empty() && opt_list.back() == '=')
  {
    opt_list.remove_suffix(1);
    has_equals = true;
  }
  opts.emplace_back(opt_list);

  ot->data.push_back(CmdOption { opts, description, default_value, default_value_str, f, has_equals });
  return *this;
}

CmdOptions::CmdOptionsAdder CmdOptions::add_options()
{ return { this }; }


struct CmdParse
{
  CmdParse(const std::vector<std::string_view>& args, std::map<std::string, std::any>& map, CmdOptions& cmdopts)
    : args(&args), map(&map), cmdopts(&cmdopts)
  {  }

  operator std::map<std::string, std::any>&()
  { return parse(); }
private:
  std::map<std::string, std::any>& parse()
  {
    for(pos = 0; pos < args->size(); ++pos)
    {
      auto& str = (*args)[pos];
      if(str.size() > 1 && str[0] == '-')
        parse_option(str);
      else
        parse_arg(str);
    }

    return *map;
  }

  const CmdOption* find(std::string_view name) const
  {
    for(auto& v : cmdopts->data)
    {
      for(auto f : v.opt)
      {
        if(f == name)
          return &v;
      }
    }
    return nullptr;
  }

  void store(const CmdOption& opt, const std::vector<std::string_view>& values)
  {
    std::any a = opt.parser(values);
    for(auto& o : opt.opt)
      (*map)[static_cast<std::string>(o)] = a;
  }

  // positional arguments belong to the option with an empty name
  void parse_arg(const std::string_view& str)
  {
    const CmdOption* implicit = find(""sv);
    if(implicit == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(rom_location { "args", 0 }, str);
      return;
    }
    store(*implicit, { str });
  }

  void parse_option(const std::string_view& str)
  {
    // first char of str is `-`, after that it should match
    const CmdOption* opt = find(str.substr(1));
    if(opt == nullptr)
    {
      diagnostic <<= diagnostic_db::args::unknown_arg(rom_location { "args", 0 }, str);
      return;
    }
    if(!opt->has_equals)
    {
      store(*opt, { });
      return;
    }
    if(pos + 1 >= args->size())
    {
      diagnostic <<= diagnostic_db::args::missing_value(rom_location { "args", 0 }, str);
      return;
    }
    store(*opt, { (*args)[++pos] });
  }

private:
  const std::vector<std::string_view>* args;
  std::map<std::string, std::any>* map;

  CmdOptions* cmdopts;

  std::size_t pos { 0 };
};

std::map<std::string, std::any> CmdOptions::parse(int argc, const char** argv)
{
  std::map<std::string, std::any> map;
  for(auto& v : data)
  {
    for(auto f : v.opt)
      map[static_cast<std::string>(f)] = v.default_value;
  }
  if(argc - 1 <= 0)
    return map;

  std::vector<std::string_view> args;
  args.reserve(argc - 1);

  for(int i = 1; i < argc; ++i)
  {
    // We want to split options at equals, e.g. --profile=original
    std::string_view v = argv[i];
    if(auto it = v.find('='); !v.empty() && v.front() == '-' && it != std::string_view::npos)
    {
      args.push_back(v.substr(0, it));
      args.push_back(v.substr(it + 1)); // + 1 to remove equals
    }
    else
      args.push_back(v);
  }

  return CmdParse(args, map, *this);
}

void CmdOptions::print_help(std::FILE* f) const
{
  fmt::print(f, "{}  -  {}\n", name, description);

  for(auto& v : data)
  {
    std::string args;
    for(auto o : v.opt)
    {
      if(o.empty())
        continue;
      if(!args.empty())
        args += " or ";
      args += "-";
      args += o;
    }
    fmt::print(f, "  {:<28} {} [default={}]\n", args + (v.has_equals ? " <value>" : ""), v.description, v.default_value_str);
  }
}

}

}
