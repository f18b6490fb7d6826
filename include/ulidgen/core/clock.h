#pragma once

#include <cstdint>

namespace ulidgen::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as milliseconds since the Unix epoch (UTC).
  virtual std::uint64_t now_unix_millis() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
// A system clock set before 1970 reads as 0.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_millis() override;
};

// Fixed clock: returns a constant timestamp for deterministic tests.
// set() and advance() move the reading explicitly.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_millis) : fixed_millis_(fixed_millis) {}
  ~FixedClock() override = default;

  FixedClock(const FixedClock&) = default;
  FixedClock& operator=(const FixedClock&) = default;
  FixedClock(FixedClock&&) = default;
  FixedClock& operator=(FixedClock&&) = default;

  std::uint64_t now_unix_millis() override;

  void set(std::uint64_t millis) { fixed_millis_ = millis; }
  void advance(std::uint64_t delta_millis) { fixed_millis_ += delta_millis; }

 private:
  std::uint64_t fixed_millis_;
};

}  // namespace ulidgen::core
