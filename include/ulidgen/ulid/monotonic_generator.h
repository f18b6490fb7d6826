#pragma once

#include "ulidgen/core/clock.h"
#include "ulidgen/core/random_source.h"
#include "ulidgen/ulid/ulid.h"

#include <cstdint>
#include <optional>

namespace ulidgen::ulid {

// MonotonicGenerator produces strictly increasing ULIDs.
//
// Every successful call returns a value greater than the one before it:
// - requested timestamp newer than the previous value: fresh random payload
// - same timestamp, or an older one (clock regression or an earlier pinned
//   timestamp): the previous timestamp is kept and its payload incremented by 1
//
// State is only replaced on success. kRandomOverflow is returned once the
// payload for a timestamp is exhausted; kTimestampOverflow when a fresh
// timestamp exceeds 48 bits.
//
// Thread-safety: none. Use one instance per thread or SynchronizedGenerator.
// Clock and random source are borrowed and must outlive the generator.
class MonotonicGenerator {
 public:
  MonotonicGenerator(core::IClock& clock, core::IRandomSource& random,
                     std::optional<Ulid> previous = std::nullopt)
      : clock_(clock), random_(random), previous_(previous) {}
  ~MonotonicGenerator() = default;

  // Not copyable or movable: one instance is one stream.
  MonotonicGenerator(const MonotonicGenerator&) = delete;
  MonotonicGenerator& operator=(const MonotonicGenerator&) = delete;
  MonotonicGenerator(MonotonicGenerator&&) = delete;
  MonotonicGenerator& operator=(MonotonicGenerator&&) = delete;

  // Equivalent to generate_at(clock.now_unix_millis()).
  [[nodiscard]] UlidResult generate();

  [[nodiscard]] UlidResult generate_at(std::uint64_t timestamp_ms);

  [[nodiscard]] const std::optional<Ulid>& previous() const { return previous_; }

 private:
  core::IClock& clock_;
  core::IRandomSource& random_;
  std::optional<Ulid> previous_;
};

}  // namespace ulidgen::ulid
