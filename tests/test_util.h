#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "zf/error.h"

namespace zf::test {

inline std::vector<uint8_t> FromHex(std::string_view hex) {
  auto nibble = [](char c) -> uint8_t {
    if (c >= '0' && c <= '9') return static_cast<uint8_t>(c - '0');
    if (c >= 'a' && c <= 'f') return static_cast<uint8_t>(c - 'a' + 10);
    return static_cast<uint8_t>(c - 'A' + 10);
  };
  std::vector<uint8_t> out;
  out.reserve(hex.size() / 2);
  for (size_t i = 0; i + 1 < hex.size(); i += 2) {
    out.push_back(static_cast<uint8_t>((nibble(hex[i]) << 4) | nibble(hex[i + 1])));
  }
  return out;
}

inline std::vector<uint8_t> PatternBytes(size_t size, uint32_t seed) {
  std::vector<uint8_t> out(size);
  uint32_t state = seed * 2654435761u + 1;
  for (auto& byte : out) {
    state = state * 1103515245u + 12345u;
    byte = static_cast<uint8_t>(state >> 16);
  }
  return out;
}

// Runs |fn| and returns the zf::Error code it throws, or -1 when it returns.
template <typename Fn>
int CaptureErrorCode(Fn&& fn) {
  try {
    fn();
  } catch (const zf::Error& error) {
    return error.code;
  }
  return -1;
}

}  // namespace zf::test
