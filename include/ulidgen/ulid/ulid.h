#pragma once

#include "ulidgen/core/result.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace ulidgen::ulid {

// A ULID is a 128-bit value: 48-bit Unix millisecond timestamp followed by an
// 80-bit random payload, stored big-endian so that byte-wise comparison equals
// comparison as an unsigned 128-bit integer.
//
//   bytes[0..5]   timestamp (ms since Unix epoch)
//   bytes[6..15]  random payload

inline constexpr std::size_t kBinaryLength = 16;
inline constexpr std::size_t kTimestampLength = 6;
inline constexpr std::size_t kRandomLength = 10;
inline constexpr std::size_t kTextLength = 26;
inline constexpr std::uint64_t kMaxTimestamp = (std::uint64_t{1} << 48u) - 1u;

using Bytes = std::array<std::uint8_t, kBinaryLength>;
using Random80 = std::array<std::uint8_t, kRandomLength>;

struct Ulid {
  Bytes bytes{};
  auto operator<=>(const Ulid&) const = default;  // unsigned 128-bit ordering
};

// Two logical fields of a ULID.
struct UlidParts {
  std::uint64_t timestamp_ms{0};
  Random80 random{};
  auto operator<=>(const UlidParts&) const = default;
};

enum class UlidError {
  kInvalidLength,      // text is not 26 characters, or binary is not 16 bytes
  kInvalidCharacter,   // character outside the Crockford base-32 alphabet
  kOverflow,           // text encodes a value wider than 128 bits
  kTimestampOverflow,  // timestamp exceeds 48 bits
  kRandomOverflow,     // monotonic increment would wrap the 80-bit payload
};

enum class LetterCase {
  kUpper,
  kLower,
};

using UlidResult = core::Result<Ulid, UlidError>;

}  // namespace ulidgen::ulid
