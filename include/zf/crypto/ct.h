#pragma once
#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

namespace zf::crypto::ct {

// Compares digests and tags without an early exit on the first differing byte.
// A length mismatch returns false immediately since lengths are public.
inline bool CompareEqual(std::span<const uint8_t> lhs, std::span<const uint8_t> rhs) noexcept {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  volatile uint8_t accumulated = 0;
  for (size_t i = 0; i < lhs.size(); ++i) {
    accumulated = static_cast<uint8_t>(accumulated | (lhs[i] ^ rhs[i]));
  }
  std::atomic_signal_fence(std::memory_order_seq_cst);
  return accumulated == 0;
}

template <size_t N>
bool CompareEqual(const std::array<uint8_t, N>& lhs, const std::array<uint8_t, N>& rhs) noexcept {
  return CompareEqual(std::span<const uint8_t>(lhs), std::span<const uint8_t>(rhs));
}

}  // namespace zf::crypto::ct
