#pragma once

#include <functional>
#include <iostream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace budgetam::apps {

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns false when the value is invalid; it prints its own message.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;                        // NOLINT(readability-identifier-naming)
  std::vector<std::string> positional;  // NOLINT(readability-identifier-naming)
  bool valid{true};                     // false on any usage error
};

// parse_options iterates argv[start..argc-1] and dispatches each recognised flag
// to its handler. Non-flag tokens are collected as positional arguments.
// Unknown flags, missing values and rejected values are reported to stderr and
// mark the result invalid; parsing continues so every problem is reported.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 1,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    auto it = option_map.find(arg);
    if (it != option_map.end()) {
      const Option<Config>* opt = it->second;
      if (!opt->requires_value) {
        parsed.valid = opt->handler(parsed.config, "") && parsed.valid;
      } else if (i + 1 < argc) {
        parsed.valid =
            opt->handler(parsed.config,
                         argv[++i]) &&  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            parsed.valid;
      } else {
        std::cerr << "Option " << arg << " requires a value\n";
        parsed.valid = false;
      }
    } else if (arg.size() > 1 && arg[0] == '-') {
      std::cerr << "Unknown option: " << arg << "\n";
      parsed.valid = false;
    } else {
      parsed.positional.push_back(std::move(arg));
    }
  }

  return parsed;
}

// One line per option: "  --name <value>  description"
template <typename Config>
void print_options(std::ostream& out, const std::vector<Option<Config>>& options) {
  for (const auto& opt : options) {
    out << "  " << opt.name << (opt.requires_value ? " <value>" : "") << "\n      "
        << opt.description << "\n";
  }
}

}  // namespace budgetam::apps
