#pragma once

#include <functional>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_map>
#include <vector>

namespace fetters::apps {

// How a flag takes its value.
//   kNone:     a switch (--json)
//   kRequired: the next token is the value (--company Acme, -c Acme)
//   kOptional: the next token is the value unless it looks like a flag (--stages [N])
// `--name=value` is accepted for kRequired and kOptional.
enum class ValueMode {
  kNone,
  kRequired,
  kOptional,
};

// Option describes a single command-line flag accepted by a subcommand.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns true on success, false on validation failure. A value-less
// kOptional flag calls the handler with an empty string.
template <typename Config>
struct Option {
  std::string name;        // NOLINT(readability-identifier-naming)
  std::string short_name;  // NOLINT(readability-identifier-naming)
  ValueMode mode{ValueMode::kNone};  // NOLINT(readability-identifier-naming)
  std::string description;           // NOLINT(readability-identifier-naming)
  std::function<bool(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

template <typename Config>
struct ParsedArgs {
  Config config;
  std::vector<std::string> positionals;
  // False when any flag was unknown, lacked its value, or failed its handler.
  bool valid{true};
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler and collects the remaining tokens as positionals.
// Unknown flags and missing values are reported to stderr.
template <typename Config>
ParsedArgs<Config> parse_options(int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
                                 const std::vector<Option<Config>>& options, int start = 2,
                                 Config default_config = {}) {
  ParsedArgs<Config> parsed{std::move(default_config), {}, true};

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
    if (!opt.short_name.empty()) {
      option_map[opt.short_name] = &opt;
    }
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    std::string inline_value;
    bool has_inline_value = false;
    if (arg.rfind("--", 0) == 0) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inline_value = arg.substr(eq + 1);
        arg = arg.substr(0, eq);
        has_inline_value = true;
      }
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      if (arg.size() > 1 && arg[0] == '-') {
        std::cerr << "Unknown option: " << arg << "\n";
        parsed.valid = false;
      } else {
        parsed.positionals.push_back(arg);
      }
      continue;
    }

    const Option<Config>* opt = it->second;
    std::string value;
    switch (opt->mode) {
      case ValueMode::kNone:
        if (has_inline_value) {
          std::cerr << "Option " << arg << " does not take a value\n";
          parsed.valid = false;
          continue;
        }
        break;
      case ValueMode::kRequired:
        if (has_inline_value) {
          value = inline_value;
        } else if (i + 1 < argc) {
          value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        } else {
          std::cerr << "Option " << arg << " requires a value\n";
          parsed.valid = false;
          continue;
        }
        break;
      case ValueMode::kOptional:
        if (has_inline_value) {
          value = inline_value;
        } else if (i + 1 < argc &&
                   argv[i + 1][0] != '-') {  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
          value = argv[++i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        break;
    }

    if (!opt->handler(parsed.config, value)) {
      parsed.valid = false;
    }
  }

  return parsed;
}

// One line per option, aligned, for subcommand help.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream out;
  for (const auto& opt : options) {
    std::string flags = opt.short_name.empty() ? "    " : opt.short_name + ", ";
    flags += opt.name;
    if (opt.mode == ValueMode::kRequired) {
      flags += " <value>";
    } else if (opt.mode == ValueMode::kOptional) {
      flags += " [value]";
    }
    out << "  " << std::left << std::setw(26) << flags << opt.description << "\n";
  }
  return out.str();
}

}  // namespace fetters::apps
