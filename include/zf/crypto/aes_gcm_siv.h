#pragma once
#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace zf::crypto {

// Tag values are part of the Encryption Header wire format.
enum class AeadAlgorithm : uint8_t {
  kAes128GcmSiv = 0,
  kAes256GcmSiv = 1,
};

struct AES_GCM_SIV {
  static constexpr size_t NONCE_SIZE = 12;
  static constexpr size_t TAG_SIZE = 16;
  static constexpr uint64_t MAX_INPUT_SIZE = uint64_t{1} << 36;

  static constexpr size_t KeySize(AeadAlgorithm algorithm) noexcept {
    return algorithm == AeadAlgorithm::kAes128GcmSiv ? 16 : 32;
  }
};

bool IsKnownAeadAlgorithm(uint8_t tag) noexcept;

// RFC 8452 AEAD_AES_*_GCM_SIV. Returns ciphertext || tag. Throws zf::Error on
// invalid key size or oversized input.
std::vector<uint8_t> AES_GCM_SIV_Seal(AeadAlgorithm algorithm,
                                      std::span<const uint8_t> key,
                                      std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce,
                                      std::span<const uint8_t> aad,
                                      std::span<const uint8_t> plaintext);

// Verifies and decrypts ciphertext || tag. Throws AuthenticationFailureError
// on tag mismatch; no plaintext is returned in that case.
std::vector<uint8_t> AES_GCM_SIV_Open(AeadAlgorithm algorithm,
                                      std::span<const uint8_t> key,
                                      std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce,
                                      std::span<const uint8_t> aad,
                                      std::span<const uint8_t> sealed);

// POLYVAL universal hash over already padded input, exposed for tests.
std::array<uint8_t, 16> Polyval(std::span<const uint8_t, 16> h, std::span<const uint8_t> padded_input);

}  // namespace zf::crypto
