#pragma once

#include <cstdint>
#include <random>
#include <span>
#include <utility>
#include <vector>

namespace ulidgen::core {

// Abstract random byte source for dependency injection.
// Allows production code to draw OS entropy while tests use reproducible bytes.
class IRandomSource {
 public:
  virtual ~IRandomSource() = default;

  // Overwrite every byte of out.
  virtual void fill(std::span<std::uint8_t> out) = 0;

 protected:
  IRandomSource() = default;
  IRandomSource(const IRandomSource&) = default;
  IRandomSource& operator=(const IRandomSource&) = default;
  IRandomSource(IRandomSource&&) = default;
  IRandomSource& operator=(IRandomSource&&) = default;
};

// Production source backed by std::random_device (the OS entropy pool on Linux).
// Not thread-safe; guard externally when shared.
class SystemRandomSource final : public IRandomSource {
 public:
  SystemRandomSource() = default;
  ~SystemRandomSource() override = default;

  // Not copyable or movable (owns a random_device)
  SystemRandomSource(const SystemRandomSource&) = delete;
  SystemRandomSource& operator=(const SystemRandomSource&) = delete;
  SystemRandomSource(SystemRandomSource&&) = delete;
  SystemRandomSource& operator=(SystemRandomSource&&) = delete;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::random_device device_;
};

// Deterministic source: emits a wrapping byte counter (start, start+1, ...).
// Successive fill() calls continue the sequence.
class SequenceRandomSource final : public IRandomSource {
 public:
  explicit SequenceRandomSource(std::uint8_t start = 0) : next_(start) {}
  ~SequenceRandomSource() override = default;

  SequenceRandomSource(const SequenceRandomSource&) = default;
  SequenceRandomSource& operator=(const SequenceRandomSource&) = default;
  SequenceRandomSource(SequenceRandomSource&&) = default;
  SequenceRandomSource& operator=(SequenceRandomSource&&) = default;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::uint8_t next_;
};

// Deterministic source: every fill() writes pattern repeated from its first byte.
// An empty pattern fills with zeros.
class FixedRandomSource final : public IRandomSource {
 public:
  explicit FixedRandomSource(std::vector<std::uint8_t> pattern) : pattern_(std::move(pattern)) {}
  ~FixedRandomSource() override = default;

  FixedRandomSource(const FixedRandomSource&) = default;
  FixedRandomSource& operator=(const FixedRandomSource&) = default;
  FixedRandomSource(FixedRandomSource&&) = default;
  FixedRandomSource& operator=(FixedRandomSource&&) = default;

  void fill(std::span<std::uint8_t> out) override;

 private:
  std::vector<std::uint8_t> pattern_;
};

}  // namespace ulidgen::core
