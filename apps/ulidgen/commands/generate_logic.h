#pragma once

#include "ulidgen/ulid/monotonic_generator.h"
#include "ulidgen/ulid/ulid.h"

#include <cstdint>
#include <optional>
#include <ostream>

namespace ulidgen::cli {

struct GenerateRequest {
  std::optional<std::uint64_t> pinned_timestamp_ms;  // nullopt: wall clock per value
  std::uint32_t count{1};
  ulid::LetterCase letter_case{ulid::LetterCase::kUpper};
};

// execute_generate writes request.count ULIDs to out, one per line, all from
// the given generator so the batch is strictly increasing.
// On a generator error, stops, reports to err and returns 1. Returns 0 otherwise.
int execute_generate(const GenerateRequest& request, ulid::MonotonicGenerator& generator,
                     std::ostream& out, std::ostream& err);

}  // namespace ulidgen::cli
