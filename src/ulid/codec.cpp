#include "ulidgen/ulid/codec.h"

#include "ulidgen/core/normalization.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace ulidgen::ulid {

namespace {

constexpr std::uint8_t kInvalid = 0xFF;

// Largest value the first character may carry: 26 * 5 = 130 bits, so its top
// two bits are padding and must be zero.
constexpr std::uint8_t kMaxLeadingValue = 7;

// ASCII -> 5-bit value. Upper and lower case map alike; everything else is kInvalid.
constexpr std::array<std::uint8_t, 256> kDecodeTable = [] {
  std::array<std::uint8_t, 256> table{};
  table.fill(kInvalid);
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const auto upper = static_cast<unsigned char>(kAlphabet[i]);
    table[upper] = static_cast<std::uint8_t>(i);
    if (upper >= 'A' && upper <= 'Z') {
      table[upper + ('a' - 'A')] = static_cast<std::uint8_t>(i);
    }
  }
  return table;
}();

std::uint64_t load_u64_be(const std::uint8_t* src) {
  std::uint64_t value = 0;
  for (std::size_t i = 0; i < 8; ++i) {
    value = (value << 8u) | src[i];
  }
  return value;
}

void store_u64_be(std::uint64_t value, std::uint8_t* dst) {
  for (std::size_t i = 0; i < 8; ++i) {
    dst[7 - i] = static_cast<std::uint8_t>(value & 0xFFu);
    value >>= 8u;
  }
}

// Five bits of the 128-bit value (hi:lo) whose lowest bit sits at `shift`.
std::uint8_t five_bits_at(std::uint64_t hi, std::uint64_t lo, unsigned shift) {
  std::uint64_t bits = 0;
  if (shift >= 64u) {
    bits = hi >> (shift - 64u);
  } else {
    bits = lo >> shift;
    if (shift > 59u) {
      bits |= hi << (64u - shift);
    }
  }
  return static_cast<std::uint8_t>(bits & 0x1Fu);
}

}  // namespace

std::string encode(const Ulid& value, LetterCase letter_case) {
  const std::uint64_t hi = load_u64_be(value.bytes.data());
  const std::uint64_t lo = load_u64_be(value.bytes.data() + 8);

  std::string out(kTextLength, '0');
  for (std::size_t i = 0; i < kTextLength; ++i) {
    const auto shift = static_cast<unsigned>(5u * (kTextLength - 1u - i));
    out[i] = kAlphabet[five_bits_at(hi, lo, shift)];
  }

  if (letter_case == LetterCase::kLower) {
    return core::normalize_ascii_lower(out);
  }
  return out;
}

UlidResult decode(std::string_view text) {
  if (text.size() != kTextLength) {
    return UlidResult::err(UlidError::kInvalidLength);
  }

  std::array<std::uint8_t, kTextLength> digits{};
  for (std::size_t i = 0; i < kTextLength; ++i) {
    const std::uint8_t digit = kDecodeTable[static_cast<unsigned char>(text[i])];
    if (digit == kInvalid) {
      return UlidResult::err(UlidError::kInvalidCharacter);
    }
    digits[i] = digit;
  }

  if (digits[0] > kMaxLeadingValue) {
    return UlidResult::err(UlidError::kOverflow);
  }

  std::uint64_t hi = 0;
  std::uint64_t lo = 0;
  for (const std::uint8_t digit : digits) {
    hi = (hi << 5u) | (lo >> 59u);
    lo = (lo << 5u) | digit;
  }

  Ulid value;
  store_u64_be(hi, value.bytes.data());
  store_u64_be(lo, value.bytes.data() + 8);
  return UlidResult::ok(value);
}

UlidParts split(const Ulid& value) {
  return UlidParts{timestamp_of(value), random_of(value)};
}

UlidResult join(std::uint64_t timestamp_ms, const Random80& random) {
  if (timestamp_ms > kMaxTimestamp) {
    return UlidResult::err(UlidError::kTimestampOverflow);
  }

  Ulid value;
  for (std::size_t i = 0; i < kTimestampLength; ++i) {
    value.bytes[kTimestampLength - 1 - i] = static_cast<std::uint8_t>(timestamp_ms & 0xFFu);
    timestamp_ms >>= 8u;
  }
  std::copy(random.begin(), random.end(), value.bytes.begin() + kTimestampLength);
  return UlidResult::ok(value);
}

std::uint64_t timestamp_of(const Ulid& value) {
  std::uint64_t timestamp = 0;
  for (std::size_t i = 0; i < kTimestampLength; ++i) {
    timestamp = (timestamp << 8u) | value.bytes[i];
  }
  return timestamp;
}

Random80 random_of(const Ulid& value) {
  Random80 random{};
  std::copy(value.bytes.begin() + kTimestampLength, value.bytes.end(), random.begin());
  return random;
}

Bytes to_bytes(const Ulid& value) {
  return value.bytes;
}

UlidResult from_bytes(std::span<const std::uint8_t> bytes) {
  if (bytes.size() != kBinaryLength) {
    return UlidResult::err(UlidError::kInvalidLength);
  }
  Ulid value;
  std::copy(bytes.begin(), bytes.end(), value.bytes.begin());
  return UlidResult::ok(value);
}

std::optional<Random80> increment(const Random80& random) {
  Random80 next = random;
  // Big-endian: carry runs from the last byte towards the first.
  for (auto it = next.rbegin(); it != next.rend(); ++it) {
    if (*it != 0xFFu) {
      ++(*it);
      return next;
    }
    *it = 0;
  }
  return std::nullopt;
}

std::string random_to_hex(const Random80& random) {
  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (const std::uint8_t byte : random) {
    oss << std::setw(2) << static_cast<unsigned>(byte);
  }
  return oss.str();
}

}  // namespace ulidgen::ulid
