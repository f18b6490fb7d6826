#pragma once

#include "ulidgen/ulid/ulid.h"

#include <nlohmann/json.hpp>

#include <ostream>
#include <string_view>

namespace ulidgen::cli {

enum class InspectFormat {
  kText,
  kJson,
};

// inspect_to_json describes a decoded ULID:
// {"ulid", "timestamp" (RFC 3339), "unix_ms", "random" (0x + 20 hex digits)}
[[nodiscard]] nlohmann::json inspect_to_json(const ulid::Ulid& value);

// execute_inspect decodes input and prints its components to out.
// Decode failures are reported to err and return 1.
int execute_inspect(std::string_view input, InspectFormat format, std::ostream& out,
                    std::ostream& err);

}  // namespace ulidgen::cli
