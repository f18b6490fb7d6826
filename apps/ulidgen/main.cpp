#include "ulidgen/core/clock.h"
#include "ulidgen/core/random_source.h"
#include "ulidgen/core/version.h"
#include "ulidgen/ulid/monotonic_generator.h"

#include "commands/generate_logic.h"
#include "commands/inspect_logic.h"
#include "config.h"
#include <iostream>

using namespace ulidgen;

namespace {

// Exit status for malformed command lines, kept apart from runtime failures (1).
constexpr int kUsageError = 2;

}  // namespace

// ────────────────────────────────────────────────────────────────
// Main
// ────────────────────────────────────────────────────────────────

int main(int argc, char* argv[]) {
  const auto parsed = cli::parse_args(argc, argv);
  if (!parsed.has_value()) {
    std::cerr << "Error: " << parsed.error() << "\n\nFor more information, try '--help'.\n";
    return kUsageError;
  }
  const cli::CliConfig& config = parsed.value();

  if (config.show_help) {
    std::cout << cli::usage_text();
    return 0;
  }
  if (config.show_version) {
    std::cout << "ulidgen " << core::kBuildVersion << "\n";
    return 0;
  }

  // Validate before any output so no partial results appear on error.
  const std::string config_error = cli::validate_cli_config(config);
  if (!config_error.empty()) {
    std::cerr << "Error: " << config_error << "\n";
    return kUsageError;
  }

  if (config.inspect.has_value()) {
    const auto format = config.json ? cli::InspectFormat::kJson : cli::InspectFormat::kText;
    return cli::execute_inspect(config.inspect.value(), format, std::cout, std::cerr);
  }

  const auto pinned = cli::resolve_timestamp(config);
  if (!pinned.has_value()) {
    std::cerr << "Error: " << pinned.error() << "\n";
    return 1;
  }

  // One generator per invocation: the whole batch is one monotonic stream.
  core::SystemClock clock;
  core::SystemRandomSource random;
  ulid::MonotonicGenerator generator(clock, random);

  cli::GenerateRequest request;
  request.pinned_timestamp_ms = pinned.value();
  request.count = config.count.value_or(1);
  request.letter_case = config.lowercase ? ulid::LetterCase::kLower : ulid::LetterCase::kUpper;

  return cli::execute_generate(request, generator, std::cout, std::cerr);
}
