#pragma once

#include "ulidgen/ulid/ulid.h"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace ulidgen::ulid {

// Stateless conversions between the ULID representations.
// Pure functions: no clock, no randomness, safe to call from any thread.

// Crockford base-32 alphabet (no I, L, O, U).
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

// encode renders value as 26 base-32 characters, most significant first.
// The value is zero-padded to 130 bits, so the first character is always 0-7.
[[nodiscard]] std::string encode(const Ulid& value, LetterCase letter_case = LetterCase::kUpper);

// decode parses 26 base-32 characters (case-insensitive).
// Checks run in order: length, characters left to right, 128-bit overflow.
[[nodiscard]] UlidResult decode(std::string_view text);

[[nodiscard]] UlidParts split(const Ulid& value);

// join fails with kTimestampOverflow when timestamp_ms > kMaxTimestamp.
[[nodiscard]] UlidResult join(std::uint64_t timestamp_ms, const Random80& random);

[[nodiscard]] std::uint64_t timestamp_of(const Ulid& value);
[[nodiscard]] Random80 random_of(const Ulid& value);

[[nodiscard]] Bytes to_bytes(const Ulid& value);

// from_bytes fails with kInvalidLength unless exactly 16 bytes are given.
[[nodiscard]] UlidResult from_bytes(std::span<const std::uint8_t> bytes);

// increment adds one to an 80-bit big-endian payload.
// Returns nullopt when the payload is already 2^80 - 1.
[[nodiscard]] std::optional<Random80> increment(const Random80& random);

// random_to_hex returns the payload as 20 lower-case hex digits.
[[nodiscard]] std::string random_to_hex(const Random80& random);

}  // namespace ulidgen::ulid
