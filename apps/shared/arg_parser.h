#pragma once

#include "ulidgen/core/result.h"

#include <functional>
#include <sstream>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace ulidgen::apps {

// Option describes a single command-line flag accepted by an app.
// Config is the caller-defined configuration struct that handlers populate.
//
// handler returns "" on success or an error message when the value is rejected.
// For flags without a value the handler receives an empty string.
template <typename Config>
struct Option {
  std::string name;            // NOLINT(readability-identifier-naming)
  std::string short_name;      // NOLINT(readability-identifier-naming) "" when none
  bool requires_value{false};  // NOLINT(readability-identifier-naming)
  std::string value_name;      // NOLINT(readability-identifier-naming) shown in help
  std::string description;     // NOLINT(readability-identifier-naming)
  std::function<std::string(Config&, const std::string& value)>
      handler;  // NOLINT(readability-identifier-naming)
};

// parse_options iterates argv[start..argc-1], dispatches each recognised flag
// to its handler, and returns the populated config.
//
// Accepted forms: --name value, --name=value, -s value, -svalue, -s=value, and
// clustered short flags such as -ln 2 (only the last flag in a cluster may take
// a value; any characters after it are that value).
// The first problem (unknown flag, stray positional token, missing value,
// handler rejection) stops parsing and is returned as the error.
template <typename Config>
core::Result<Config, std::string> parse_options(
    int argc, char* argv[],  // NOLINT(modernize-avoid-c-arrays)
    const std::vector<Option<Config>>& options, int start = 1, Config default_config = {}) {
  using ParseResult = core::Result<Config, std::string>;
  Config config = std::move(default_config);

  std::unordered_map<std::string, const Option<Config>*> option_map;
  for (const auto& opt : options) {
    option_map[opt.name] = &opt;
    if (!opt.short_name.empty()) {
      option_map[opt.short_name] = &opt;
    }
  }

  for (int i = start; i < argc; ++i) {
    std::string arg = argv[i];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

    // Resolves the value for opt: an attached value wins, otherwise the next token.
    auto take_value = [&](const Option<Config>* opt, bool has_attached,
                          const std::string& attached) -> core::Result<std::string, std::string> {
      using ValueResult = core::Result<std::string, std::string>;
      if (has_attached) {
        return ValueResult::ok(attached);
      }
      if (i + 1 < argc) {
        return ValueResult::ok(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
      }
      return ValueResult::err("option " + opt->name + " requires a value");
    };

    if (arg.size() > 2 && arg[0] == '-' && arg[1] != '-') {
      // Short cluster: each character is a flag until one needs a value.
      for (std::size_t pos = 1; pos < arg.size(); ++pos) {
        const std::string short_name = std::string("-") + arg[pos];
        auto it = option_map.find(short_name);
        if (it == option_map.end()) {
          return ParseResult::err("unexpected argument '" + short_name + "'");
        }

        const Option<Config>* opt = it->second;
        std::string value;
        if (opt->requires_value) {
          std::string attached = arg.substr(pos + 1);
          if (attached.starts_with("=")) {
            attached.erase(0, 1);
          }
          const bool has_attached = pos + 1 < arg.size();
          auto resolved = take_value(opt, has_attached, attached);
          if (!resolved.has_value()) {
            return ParseResult::err(resolved.error());
          }
          value = resolved.value();
          pos = arg.size();
        }

        const std::string error = opt->handler(config, value);
        if (!error.empty()) {
          return ParseResult::err(error);
        }
      }
      continue;
    }

    std::string inline_value;
    bool has_inline_value = false;
    if (arg.starts_with("--")) {
      const auto eq = arg.find('=');
      if (eq != std::string::npos) {
        inline_value = arg.substr(eq + 1);
        arg.resize(eq);
        has_inline_value = true;
      }
    }

    auto it = option_map.find(arg);
    if (it == option_map.end()) {
      return ParseResult::err("unexpected argument '" + arg + "'");
    }

    const Option<Config>* opt = it->second;
    std::string value;
    if (opt->requires_value) {
      auto resolved = take_value(opt, has_inline_value, inline_value);
      if (!resolved.has_value()) {
        return ParseResult::err(resolved.error());
      }
      value = resolved.value();
    } else if (has_inline_value) {
      return ParseResult::err("option " + opt->name + " does not take a value");
    }

    const std::string error = opt->handler(config, value);
    if (!error.empty()) {
      return ParseResult::err(error);
    }
  }

  return ParseResult::ok(std::move(config));
}

// format_options renders one help line per option, in registration order.
template <typename Config>
std::string format_options(const std::vector<Option<Config>>& options) {
  std::ostringstream oss;
  for (const auto& opt : options) {
    std::string flags = opt.short_name.empty() ? "    " : opt.short_name + ", ";
    flags += opt.name;
    if (opt.requires_value) {
      flags += " <" + opt.value_name + ">";
    }
    oss << "  " << flags;
    if (flags.size() < 28) {
      oss << std::string(28 - flags.size(), ' ');
    } else {
      oss << "\n" << std::string(30, ' ');
    }
    oss << opt.description << "\n";
  }
  return oss.str();
}

}  // namespace ulidgen::apps
