#pragma once

#include <cstdint>
#include <span>

namespace zf::crypto {

// Fills |out| from the operating system CSPRNG. Throws zf::Error when the
// platform source is unavailable; never falls back to a weaker generator.
void SystemRandomBytes(std::span<uint8_t> out);

uint64_t RandomU64();

}  // namespace zf::crypto
