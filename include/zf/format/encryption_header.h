#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "zf/crypto/aes_gcm_siv.h"
#include "zf/crypto/key_wrap.h"
#include "zf/format/codec.h"

namespace zf::format {

// Password-based encryption parameters for unwrapping the content key.
struct PbeHeader {
  static constexpr uint8_t kVersion = 1;

  crypto::KdfParameters kdf{crypto::Pbkdf2Parameters{}};
  crypto::PbeScheme scheme{crypto::PbeScheme::kAes256Cbc};
  std::array<uint8_t, crypto::kPbeIvSize> iv{};

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<PbeHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const PbeHeader&) const = default;
};

// KDF parameter object; unversioned, shape selected by the PBE KDF flag.
void EncodeKdfParameters(ByteWriter& writer, const crypto::KdfParameters& params);
Decoded<crypto::KdfParameters> DecodeKdfParameters(std::span<const uint8_t> input, crypto::KdfScheme scheme);

struct EncryptionHeader {
  static constexpr uint8_t kVersion = 1;

  PbeHeader pbe;
  crypto::AeadAlgorithm algorithm{crypto::AeadAlgorithm::kAes256GcmSiv};
  std::vector<uint8_t> wrapped_key;
  std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> nonce{};

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<EncryptionHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const EncryptionHeader&) const = default;
};

}  // namespace zf::format
