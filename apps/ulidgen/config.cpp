#include "config.h"

#include "ulidgen/core/time.h"

#include "shared/arg_parser.h"
#include <charconv>
#include <string>
#include <system_error>
#include <vector>

namespace ulidgen::cli {

namespace {

// ────────────────────────────────────────────────────────────────
// Value Parsing
// ────────────────────────────────────────────────────────────────

// parse_unsigned accepts plain decimal digits only (no sign, no whitespace).
template <typename T>
std::optional<T> parse_unsigned(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  T parsed{};
  const char* first = value.data();
  const char* last = value.data() + value.size();
  const auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

// ────────────────────────────────────────────────────────────────
// Option Handlers
// ────────────────────────────────────────────────────────────────

std::string handle_inspect(CliConfig& config, const std::string& value) {
  config.inspect = value;
  return "";
}

std::string handle_timestamp(CliConfig& config, const std::string& value) {
  const auto millis = parse_unsigned<std::uint64_t>(value);
  if (!millis.has_value()) {
    return "invalid value '" + value + "' for --timestamp: expected unsigned milliseconds";
  }
  config.timestamp_ms = millis;
  return "";
}

std::string handle_datetime(CliConfig& config, const std::string& value) {
  config.datetime = value;
  return "";
}

std::string handle_count(CliConfig& config, const std::string& value) {
  const auto count = parse_unsigned<std::uint32_t>(value);
  if (!count.has_value()) {
    return "invalid value '" + value + "' for --count: expected a non-negative integer";
  }
  config.count = count;
  return "";
}

std::string handle_lowercase(CliConfig& config, const std::string& /*value*/) {
  config.lowercase = true;
  return "";
}

std::string handle_json(CliConfig& config, const std::string& /*value*/) {
  config.json = true;
  return "";
}

std::string handle_help(CliConfig& config, const std::string& /*value*/) {
  config.show_help = true;
  return "";
}

std::string handle_version(CliConfig& config, const std::string& /*value*/) {
  config.show_version = true;
  return "";
}

// ────────────────────────────────────────────────────────────────
// Option Registry
// ────────────────────────────────────────────────────────────────

std::vector<apps::Option<CliConfig>> build_option_registry() {
  return {
      {"--inspect", "", true, "ULID", "Parse and display the components of an existing ULID",
       handle_inspect},
      {"--timestamp", "", true, "MS", "Pin the timestamp to a Unix epoch value in milliseconds",
       handle_timestamp},
      {"--datetime", "", true, "RFC3339", "Pin the timestamp to an RFC 3339 datetime string",
       handle_datetime},
      {"--count", "-n", true, "N", "Number of ULIDs to generate (default 1)", handle_count},
      {"--lowercase", "-l", false, "", "Output in lowercase", handle_lowercase},
      {"--json", "", false, "", "Print --inspect output as JSON", handle_json},
      {"--help", "-h", false, "", "Print help", handle_help},
      {"--version", "-V", false, "", "Print version", handle_version},
  };
}

}  // namespace

// ────────────────────────────────────────────────────────────────
// Parser
// ────────────────────────────────────────────────────────────────

core::Result<CliConfig, std::string> parse_args(int argc, char* argv[]) {
  return apps::parse_options(argc, argv, build_option_registry());
}

std::string validate_cli_config(const CliConfig& config) {
  if (config.inspect.has_value()) {
    if (config.timestamp_ms.has_value()) {
      return "--inspect cannot be used with --timestamp";
    }
    if (config.datetime.has_value()) {
      return "--inspect cannot be used with --datetime";
    }
    if (config.count.has_value()) {
      return "--inspect cannot be used with --count";
    }
    if (config.lowercase) {
      return "--inspect cannot be used with --lowercase";
    }
  }
  if (config.timestamp_ms.has_value() && config.datetime.has_value()) {
    return "--timestamp cannot be used with --datetime";
  }
  if (config.json && !config.inspect.has_value()) {
    return "--json requires --inspect";
  }
  return "";
}

core::Result<std::optional<std::uint64_t>, std::string> resolve_timestamp(
    const CliConfig& config) {
  using TimestampResult = core::Result<std::optional<std::uint64_t>, std::string>;

  if (config.timestamp_ms.has_value()) {
    return TimestampResult::ok(config.timestamp_ms);
  }

  if (config.datetime.has_value()) {
    const std::string& text = config.datetime.value();
    const auto parsed = core::parse_rfc3339_millis(text);
    if (!parsed.has_value()) {
      return TimestampResult::err("parse `" + text + "` as RFC 3339 datetime: " +
                                  parsed.error());
    }
    if (parsed.value() < 0) {
      return TimestampResult::err("datetime `" + text +
                                  "` is before the Unix epoch, which ULIDs cannot represent");
    }
    return TimestampResult::ok(static_cast<std::uint64_t>(parsed.value()));
  }

  return TimestampResult::ok(std::nullopt);
}

std::string usage_text() {
  std::string text =
      "A command-line ULID generator, like uuidgen but for ULIDs.\n"
      "\n"
      "Usage: ulidgen [OPTIONS]\n"
      "\n"
      "Options:\n";
  text += apps::format_options(build_option_registry());
  return text;
}

}  // namespace ulidgen::cli
