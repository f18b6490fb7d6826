#include "ulidgen/core/random_source.h"

#include <algorithm>

namespace ulidgen::core {

void SystemRandomSource::fill(std::span<std::uint8_t> out) {
  std::size_t i = 0;
  while (i < out.size()) {
    // random_device yields 32 bits per draw; spread them over up to 4 bytes.
    std::uint32_t word = device_();
    for (int b = 0; b < 4 && i < out.size(); ++b, ++i) {
      out[i] = static_cast<std::uint8_t>(word & 0xFFu);
      word >>= 8u;
    }
  }
}

void SequenceRandomSource::fill(std::span<std::uint8_t> out) {
  for (auto& byte : out) {
    byte = next_++;
  }
}

void FixedRandomSource::fill(std::span<std::uint8_t> out) {
  if (pattern_.empty()) {
    std::fill(out.begin(), out.end(), std::uint8_t{0});
    return;
  }
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = pattern_[i % pattern_.size()];
  }
}

}  // namespace ulidgen::core
