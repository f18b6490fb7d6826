#pragma once

#include "ulidgen/core/result.h"

#include <cstdint>
#include <optional>
#include <string>

namespace ulidgen::cli {

// CliConfig holds all parsed flags for the ulidgen executable.
// Optional fields mean "not given"; they are checked for conflicts by
// validate_cli_config before any command runs.
struct CliConfig {
  std::optional<std::string> inspect;       // NOLINT(readability-identifier-naming)
  std::optional<std::uint64_t> timestamp_ms;  // NOLINT(readability-identifier-naming)
  std::optional<std::string> datetime;      // NOLINT(readability-identifier-naming)
  std::optional<std::uint32_t> count;       // NOLINT(readability-identifier-naming) default 1
  bool lowercase{false};                    // NOLINT(readability-identifier-naming)
  bool json{false};                         // NOLINT(readability-identifier-naming)
  bool show_help{false};                    // NOLINT(readability-identifier-naming)
  bool show_version{false};                 // NOLINT(readability-identifier-naming)
};

// parse_args parses argv into a CliConfig.
// Returns the first syntax error (unknown flag, missing or malformed value).
[[nodiscard]] core::Result<CliConfig, std::string> parse_args(
    int argc, char* argv[]);  // NOLINT(modernize-avoid-c-arrays)

// validate_cli_config checks flag combinations.
//
// Returns: "" on success, non-empty error message on failure.
// Rules (first failure is returned):
// - --inspect excludes --timestamp, --datetime, --count and --lowercase
// - --timestamp excludes --datetime
// - --json requires --inspect
[[nodiscard]] std::string validate_cli_config(const CliConfig& config);

// resolve_timestamp turns --timestamp / --datetime into a pinned Unix millisecond value.
// nullopt means "use the wall clock". Datetimes before the Unix epoch are rejected.
[[nodiscard]] core::Result<std::optional<std::uint64_t>, std::string> resolve_timestamp(
    const CliConfig& config);

// usage_text returns the --help output.
[[nodiscard]] std::string usage_text();

}  // namespace ulidgen::cli
