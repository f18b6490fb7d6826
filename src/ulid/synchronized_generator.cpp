#include "ulidgen/ulid/synchronized_generator.h"

namespace ulidgen::ulid {

UlidResult SynchronizedGenerator::generate() {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.generate();
}

UlidResult SynchronizedGenerator::generate_at(std::uint64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.generate_at(timestamp_ms);
}

std::optional<Ulid> SynchronizedGenerator::previous() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return generator_.previous();
}

}  // namespace ulidgen::ulid
