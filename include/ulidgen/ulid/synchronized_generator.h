#pragma once

#include "ulidgen/ulid/monotonic_generator.h"

#include <mutex>
#include <optional>

namespace ulidgen::ulid {

// SynchronizedGenerator shares one monotonic stream between threads.
//
// Thread-safety: Uses std::mutex for all operations (coarse-grained locking).
// The clock and random source are only touched while the lock is held.
// Values handed out across all threads form one strictly increasing sequence.
class SynchronizedGenerator {
 public:
  SynchronizedGenerator(core::IClock& clock, core::IRandomSource& random,
                        std::optional<Ulid> previous = std::nullopt)
      : generator_(clock, random, previous) {}
  ~SynchronizedGenerator() = default;

  // Disable copy/move (mutex not copyable)
  SynchronizedGenerator(const SynchronizedGenerator&) = delete;
  SynchronizedGenerator& operator=(const SynchronizedGenerator&) = delete;
  SynchronizedGenerator(SynchronizedGenerator&&) = delete;
  SynchronizedGenerator& operator=(SynchronizedGenerator&&) = delete;

  [[nodiscard]] UlidResult generate();
  [[nodiscard]] UlidResult generate_at(std::uint64_t timestamp_ms);

  [[nodiscard]] std::optional<Ulid> previous() const;

 private:
  mutable std::mutex mutex_;
  MonotonicGenerator generator_;
};

}  // namespace ulidgen::ulid
