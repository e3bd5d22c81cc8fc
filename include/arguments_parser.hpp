#pragma once

#include <string_view>
#include <functional>
#include <cstdio>
#include <string>
#include <vector>
#include <any>
#include <map>

namespace arguments
{

// Fills `config`. Problems are reported to `diagnostic`, help text goes to `out`.
void parse(int argc, const char** argv, std::FILE* out);

namespace detail
{

  using option_parser = std::function<std::any(const std::vector<std::string_view>&)>;

  struct CmdOption
  {
    std::vector<std::string_view> opt;
    std::string_view description;
    std::any default_value;
    std::string_view default_value_str;
    option_parser parser;

    // spelled with a trailing '=', expects exactly one value
    bool has_equals;
  };
  struct CmdOptions
  {
  private:
    struct CmdOptionsAdder
    {
      CmdOptionsAdder& operator()(std::string_view opts, std::string_view description,
                                  std::any default_value, std::string_view default_value_str, const option_parser& f);

      CmdOptions* ot;
    };
    friend struct CmdParse;
  public:
    CmdOptions(std::string_view name, std::string_view description)
      : name(name), description(description)
    {  }

    CmdOptionsAdder add_options();

    std::map<std::string, std::any> parse(int argc, const char** argv);

    void print_help(std::FILE* f) const;
  private:
    std::string_view name;
    std::string_view description;

    std::vector<CmdOption> data;
  };

}

}
