#include "ulidgen/core/clock.h"

#include "ulidgen/core/time.h"

namespace ulidgen::core {

std::uint64_t SystemClock::now_unix_millis() {
  const auto millis = to_unix_millis(now_utc());
  if (millis < 0) {
    return 0;
  }
  return static_cast<std::uint64_t>(millis);
}

std::uint64_t FixedClock::now_unix_millis() {
  return fixed_millis_;
}

}  // namespace ulidgen::core
