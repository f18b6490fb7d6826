#include "inspect_logic.h"

#include "ulidgen/core/time.h"
#include "ulidgen/ulid/codec.h"

#include "error_text.h"
#include <string>

namespace ulidgen::cli {

namespace {

std::string format_random(const ulid::Random80& random) {
  return "0x" + ulid::random_to_hex(random);
}

}  // namespace

nlohmann::json inspect_to_json(const ulid::Ulid& value) {
  const auto parts = ulid::split(value);

  nlohmann::json out;
  out["ulid"] = ulid::encode(value);
  out["timestamp"] = core::format_rfc3339_millis(static_cast<std::int64_t>(parts.timestamp_ms));
  out["unix_ms"] = parts.timestamp_ms;
  out["random"] = format_random(parts.random);
  return out;
}

int execute_inspect(std::string_view input, InspectFormat format, std::ostream& out,
                    std::ostream& err) {
  const auto decoded = ulid::decode(input);
  if (!decoded.has_value()) {
    err << "Error: parse `" << input << "` as ULID: " << describe_error(decoded.error())
        << "\n";
    return 1;
  }

  const ulid::Ulid& value = decoded.value();
  if (format == InspectFormat::kJson) {
    out << inspect_to_json(value).dump(2) << "\n";
    return 0;
  }

  const auto parts = ulid::split(value);
  out << "ULID:      " << ulid::encode(value) << "\n";
  out << "Timestamp: "
      << core::format_rfc3339_millis(static_cast<std::int64_t>(parts.timestamp_ms)) << "\n";
  out << "Unix ms:   " << parts.timestamp_ms << "\n";
  out << "Random:    " << format_random(parts.random) << "\n";
  return 0;
}

}  // namespace ulidgen::cli
