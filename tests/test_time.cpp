#include "ulidgen/core/time.h"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace ulidgen::core;

namespace {

std::int64_t must_parse(const std::string& text) {
  const auto result = parse_rfc3339_millis(text);
  INFO(text);
  REQUIRE(result.has_value());
  return result.value();
}

}  // namespace

// ── parse_rfc3339_millis: accepted formats ──────────────────────────────────

TEST_CASE("parse_rfc3339_millis: UTC with milliseconds", "[time][rfc3339]") {
  CHECK(must_parse("2016-07-30T23:54:10.259Z") == 1469922850259ll);
  CHECK(must_parse("1970-01-01T00:00:00Z") == 0);
}

TEST_CASE("parse_rfc3339_millis: numeric offsets shift to UTC", "[time][rfc3339]") {
  CHECK(must_parse("2000-02-29T12:00:00+02:00") == 951818400000ll);
  CHECK(must_parse("1970-01-01T01:00:00+01:00") == 0);
  CHECK(must_parse("1969-12-31T19:00:00-05:00") == 0);
}

TEST_CASE("parse_rfc3339_millis: long fractions truncate to milliseconds", "[time][rfc3339]") {
  CHECK(must_parse("2024-01-01T00:00:00.123456789-05:30") == 1704087000123ll);
  CHECK(must_parse("1970-01-01T00:00:00.5Z") == 500);
  CHECK(must_parse("1970-01-01T00:00:00.0009Z") == 0);
}

TEST_CASE("parse_rfc3339_millis: lower-case and space separators", "[time][rfc3339]") {
  CHECK(must_parse("1970-01-01t00:00:01z") == 1000);
  CHECK(must_parse("1970-01-01 00:00:01Z") == 1000);
}

TEST_CASE("parse_rfc3339_millis: pre-epoch values are negative", "[time][rfc3339]") {
  CHECK(must_parse("1969-12-31T23:59:59.999Z") == -1);
  CHECK(must_parse("1969-12-31T00:00:00Z") == -86400000ll);
}

// ── parse_rfc3339_millis: rejected formats ──────────────────────────────────

TEST_CASE("parse_rfc3339_millis: malformed input is rejected", "[time][rfc3339]") {
  CHECK_FALSE(parse_rfc3339_millis("").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:54:10").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016/07/30T23:54:10Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30X23:54:10Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:54:10.Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:54:10+0100").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:54:10Zjunk").has_value());
  CHECK_FALSE(parse_rfc3339_millis("not a datetime at all").has_value());
}

TEST_CASE("parse_rfc3339_millis: out-of-range fields are rejected", "[time][rfc3339]") {
  CHECK_FALSE(parse_rfc3339_millis("2016-13-01T00:00:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-00-01T00:00:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2015-02-29T00:00:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-04-31T00:00:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T24:00:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:60:00Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-12-31T23:59:60Z").has_value());
  CHECK_FALSE(parse_rfc3339_millis("2016-07-30T23:54:10+24:00").has_value());

  CHECK(parse_rfc3339_millis("2016-02-29T00:00:00Z").has_value());
}

// ── format_rfc3339_millis ───────────────────────────────────────────────────

TEST_CASE("format_rfc3339_millis: millisecond fraction only when non-zero", "[time][rfc3339]") {
  CHECK(format_rfc3339_millis(1469922850259ll) == "2016-07-30T23:54:10.259+00:00");
  CHECK(format_rfc3339_millis(0) == "1970-01-01T00:00:00+00:00");
  CHECK(format_rfc3339_millis(1000) == "1970-01-01T00:00:01+00:00");
  CHECK(format_rfc3339_millis(1) == "1970-01-01T00:00:00.001+00:00");
}

TEST_CASE("format_rfc3339_millis: years past 9999 carry a leading plus sign", "[time][rfc3339]") {
  CHECK(format_rfc3339_millis(253402300799999ll) == "9999-12-31T23:59:59.999+00:00");
  CHECK(format_rfc3339_millis(253402300800000ll) == "+10000-01-01T00:00:00+00:00");
  // Largest 48-bit ULID timestamp.
  CHECK(format_rfc3339_millis(281474976710655ll) == "+10889-08-02T05:31:50.655+00:00");
}

TEST_CASE("format_rfc3339_millis and parse_rfc3339_millis agree", "[time][rfc3339]") {
  for (const std::int64_t millis : {0ll, 1ll, 951818400000ll, 1469922850259ll, 1704087000123ll}) {
    CHECK(must_parse(format_rfc3339_millis(millis)) == millis);
  }
}
