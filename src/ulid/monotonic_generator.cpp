#include "ulidgen/ulid/monotonic_generator.h"

#include "ulidgen/ulid/codec.h"

namespace ulidgen::ulid {

UlidResult MonotonicGenerator::generate() {
  return generate_at(clock_.now_unix_millis());
}

UlidResult MonotonicGenerator::generate_at(std::uint64_t timestamp_ms) {
  if (!previous_.has_value() || timestamp_ms > timestamp_of(previous_.value())) {
    Random80 random{};
    random_.fill(random);
    auto fresh = join(timestamp_ms, random);
    if (fresh.has_value()) {
      previous_ = fresh.value();
    }
    return fresh;
  }

  // Same or earlier millisecond: stay on the previous timestamp so ordering holds.
  const auto parts = split(previous_.value());
  const auto next_random = increment(parts.random);
  if (!next_random.has_value()) {
    return UlidResult::err(UlidError::kRandomOverflow);
  }

  auto next = join(parts.timestamp_ms, next_random.value());
  if (next.has_value()) {
    previous_ = next.value();
  }
  return next;
}

}  // namespace ulidgen::ulid
