#pragma once

#include <array>
#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace zf::crypto {

inline constexpr size_t kHmacSha256Size = 32;

// HMAC-SHA256 (RFC 2104) through the active CryptoProvider.
std::array<uint8_t, kHmacSha256Size> HmacSha256(std::span<const uint8_t> key,
                                                std::span<const uint8_t> message);

// Reports iteration progress of the current output block.
using PBKDF2ProgressCallback = std::function<void(uint32_t current, uint32_t total)>;

// RFC 8018 PBKDF2 with HMAC-SHA256 as the PRF. An iteration count of zero is treated as one.
std::vector<uint8_t> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                        std::span<const uint8_t> salt,
                                        uint32_t iterations,
                                        size_t output_size,
                                        PBKDF2ProgressCallback progress = {});

}  // namespace zf::crypto
