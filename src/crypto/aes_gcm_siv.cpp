#include "zf/crypto/aes_gcm_siv.h"

#include <algorithm>
#include <cstring>
#include <string>

#include "zf/common.h"
#include "zf/crypto/ct.h"
#include "zf/crypto/provider.h"
#include "zf/error.h"
#include "zf/security/zeroizer.h"

namespace zf::crypto {

namespace {

using Block = std::array<uint8_t, 16>;

// GF(2^128) element in GHASH bit order: bit 0 is the MSB of byte 0.
struct FieldElement {
  uint64_t hi{0};
  uint64_t lo{0};
};

constexpr uint64_t kGhashReduction = 0xE100000000000000ull;

FieldElement LoadReversed(const uint8_t* bytes) {
  // POLYVAL is GHASH over byte-reversed blocks (RFC 8452 appendix A).
  FieldElement e{};
  for (int i = 0; i < 8; ++i) {
    e.hi = (e.hi << 8) | bytes[15 - i];
  }
  for (int i = 8; i < 16; ++i) {
    e.lo = (e.lo << 8) | bytes[15 - i];
  }
  return e;
}

Block StoreReversed(const FieldElement& e) {
  Block out{};
  for (int i = 0; i < 8; ++i) {
    out[15 - i] = static_cast<uint8_t>(e.hi >> (56 - 8 * i));
  }
  for (int i = 8; i < 16; ++i) {
    out[15 - i] = static_cast<uint8_t>(e.lo >> (56 - 8 * (i - 8)));
  }
  return out;
}

// All-ones when the low bit of |word| is set, zero otherwise.
constexpr uint64_t LowBitMask(uint64_t word) {
  return uint64_t{0} - (word & 1u);
}

// The reduction and the multiply below select with masks rather than
// branches; every operand is derived from the authentication key.
void ShiftRightReduce(FieldElement& v) {
  const uint64_t carry = LowBitMask(v.lo);
  v.lo = (v.lo >> 1) | (v.hi << 63);
  v.hi = (v.hi >> 1) ^ (kGhashReduction & carry);
}

FieldElement GhashMultiply(const FieldElement& x, const FieldElement& y) {
  FieldElement z{};
  FieldElement v = y;
  for (int i = 0; i < 128; ++i) {
    const uint64_t word = i < 64 ? x.hi : x.lo;
    const uint64_t select = LowBitMask(word >> (63 - (i % 64)));
    z.hi ^= v.hi & select;
    z.lo ^= v.lo & select;
    ShiftRightReduce(v);
  }
  return z;
}

class PolyvalState {
public:
  explicit PolyvalState(std::span<const uint8_t, 16> h) : h_(LoadReversed(h.data())) {
    ShiftRightReduce(h_); // mulX_GHASH
  }

  ~PolyvalState() {
    security::Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(&h_), sizeof(h_)));
  }

  void AbsorbBlock(const uint8_t* block) {
    const FieldElement x = LoadReversed(block);
    s_.hi ^= x.hi;
    s_.lo ^= x.lo;
    s_ = GhashMultiply(s_, h_);
  }

  // Whole blocks, then the tail zero-padded to a block boundary.
  void AbsorbPadded(std::span<const uint8_t> data) {
    size_t offset = 0;
    while (data.size() - offset >= 16) {
      AbsorbBlock(data.data() + offset);
      offset += 16;
    }
    if (offset < data.size()) {
      Block tail{};
      std::memcpy(tail.data(), data.data() + offset, data.size() - offset);
      AbsorbBlock(tail.data());
    }
  }

  [[nodiscard]] Block Result() const { return StoreReversed(s_); }

private:
  FieldElement h_{};
  FieldElement s_{};
};

struct DerivedKeys {
  Block auth_key{};
  std::array<uint8_t, 32> enc_key{};
  size_t enc_key_size{16};

  DerivedKeys() = default;
  DerivedKeys(const DerivedKeys&) = delete;
  DerivedKeys& operator=(const DerivedKeys&) = delete;
  ~DerivedKeys() {
    security::Zeroizer::Wipe(auth_key);
    security::Zeroizer::Wipe(enc_key);
  }

  [[nodiscard]] std::span<const uint8_t> EncKey() const {
    return std::span<const uint8_t>(enc_key.data(), enc_key_size);
  }
};

void ValidateInputs(AeadAlgorithm algorithm, std::span<const uint8_t> key,
                    std::span<const uint8_t> aad, uint64_t message_size) {
  if (key.size() != AES_GCM_SIV::KeySize(algorithm)) {
    throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure,
                    "AES-GCM-SIV key size " + std::to_string(key.size()) + " does not match algorithm");
  }
  if (aad.size() > AES_GCM_SIV::MAX_INPUT_SIZE || message_size > AES_GCM_SIV::MAX_INPUT_SIZE) {
    throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure,
                    "AES-GCM-SIV input exceeds 2^36 bytes");
  }
}

void DeriveKeys(CryptoProvider& provider, std::span<const uint8_t> key_generating_key,
                std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce, DerivedKeys& keys) {
  const size_t blocks = key_generating_key.size() == 32 ? 6 : 4;
  std::array<uint8_t, 16 * 6> input{};
  std::array<uint8_t, 16 * 6> output{};
  security::Zeroizer::ScopeWiper<uint8_t> output_guard{std::span<uint8_t>(output)};
  for (size_t i = 0; i < blocks; ++i) {
    const uint32_t counter_le = zf::ToLittleEndian32(static_cast<uint32_t>(i));
    std::memcpy(input.data() + 16 * i, &counter_le, sizeof(counter_le));
    std::memcpy(input.data() + 16 * i + 4, nonce.data(), nonce.size());
  }
  provider.EncryptAESBlocks(key_generating_key,
                            std::span<const uint8_t>(input.data(), 16 * blocks),
                            std::span<uint8_t>(output.data(), 16 * blocks));
  std::memcpy(keys.auth_key.data(), output.data(), 8);
  std::memcpy(keys.auth_key.data() + 8, output.data() + 16, 8);
  keys.enc_key_size = key_generating_key.size();
  for (size_t i = 2; i < blocks; ++i) {
    std::memcpy(keys.enc_key.data() + 8 * (i - 2), output.data() + 16 * i, 8);
  }
}

Block ComputeTag(CryptoProvider& provider, const DerivedKeys& keys,
                 std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce,
                 std::span<const uint8_t> aad, std::span<const uint8_t> plaintext) {
  PolyvalState polyval(std::span<const uint8_t, 16>(keys.auth_key));
  polyval.AbsorbPadded(aad);
  polyval.AbsorbPadded(plaintext);
  Block length_block{};
  const uint64_t aad_bits = zf::ToLittleEndian64(static_cast<uint64_t>(aad.size()) * 8);
  const uint64_t pt_bits = zf::ToLittleEndian64(static_cast<uint64_t>(plaintext.size()) * 8);
  std::memcpy(length_block.data(), &aad_bits, sizeof(aad_bits));
  std::memcpy(length_block.data() + 8, &pt_bits, sizeof(pt_bits));
  polyval.AbsorbBlock(length_block.data());

  Block s = polyval.Result();
  for (size_t i = 0; i < nonce.size(); ++i) {
    s[i] ^= nonce[i];
  }
  s[15] &= 0x7F;
  Block tag{};
  provider.EncryptAESBlocks(keys.EncKey(), s, tag);
  return tag;
}

// Counter mode with a 32-bit little-endian counter in the first word.
void ApplyKeystream(CryptoProvider& provider, const DerivedKeys& keys, const Block& tag,
                    std::span<const uint8_t> input, std::span<uint8_t> output) {
  if (input.empty()) {
    return;
  }
  Block initial = tag;
  initial[15] |= 0x80;
  uint32_t counter_le = 0;
  std::memcpy(&counter_le, initial.data(), sizeof(counter_le));
  const uint32_t counter = zf::ToLittleEndian32(counter_le);

  const size_t block_count = (input.size() + 15) / 16;
  std::vector<uint8_t> counters(block_count * 16);
  for (size_t i = 0; i < block_count; ++i) {
    std::memcpy(counters.data() + 16 * i, initial.data(), 16);
    const uint32_t value = zf::ToLittleEndian32(static_cast<uint32_t>(counter + i));
    std::memcpy(counters.data() + 16 * i, &value, sizeof(value));
  }
  std::vector<uint8_t> keystream(counters.size());
  provider.EncryptAESBlocks(keys.EncKey(), counters, keystream);
  for (size_t i = 0; i < input.size(); ++i) {
    output[i] = static_cast<uint8_t>(input[i] ^ keystream[i]);
  }
  security::Zeroizer::WipeVector(keystream);
}

}  // namespace

bool IsKnownAeadAlgorithm(uint8_t tag) noexcept {
  return tag == static_cast<uint8_t>(AeadAlgorithm::kAes128GcmSiv) ||
         tag == static_cast<uint8_t>(AeadAlgorithm::kAes256GcmSiv);
}

std::array<uint8_t, 16> Polyval(std::span<const uint8_t, 16> h, std::span<const uint8_t> padded_input) {
  PolyvalState state(h);
  state.AbsorbPadded(padded_input);
  return state.Result();
}

std::vector<uint8_t> AES_GCM_SIV_Seal(AeadAlgorithm algorithm,
                                      std::span<const uint8_t> key,
                                      std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce,
                                      std::span<const uint8_t> aad,
                                      std::span<const uint8_t> plaintext) {
  ValidateInputs(algorithm, key, aad, plaintext.size());
  auto provider = GetCryptoProviderShared();
  DerivedKeys keys;
  DeriveKeys(*provider, key, nonce, keys);
  const Block tag = ComputeTag(*provider, keys, nonce, aad, plaintext);

  std::vector<uint8_t> sealed(plaintext.size() + AES_GCM_SIV::TAG_SIZE);
  ApplyKeystream(*provider, keys, tag, plaintext, std::span<uint8_t>(sealed.data(), plaintext.size()));
  std::copy(tag.begin(), tag.end(), sealed.begin() + static_cast<std::ptrdiff_t>(plaintext.size()));
  return sealed;
}

std::vector<uint8_t> AES_GCM_SIV_Open(AeadAlgorithm algorithm,
                                      std::span<const uint8_t> key,
                                      std::span<const uint8_t, AES_GCM_SIV::NONCE_SIZE> nonce,
                                      std::span<const uint8_t> aad,
                                      std::span<const uint8_t> sealed) {
  if (sealed.size() < AES_GCM_SIV::TAG_SIZE) {
    throw zf::AuthenticationFailureError("AES-GCM-SIV input shorter than tag");
  }
  const size_t body_size = sealed.size() - AES_GCM_SIV::TAG_SIZE;
  ValidateInputs(algorithm, key, aad, body_size);
  auto provider = GetCryptoProviderShared();
  DerivedKeys keys;
  DeriveKeys(*provider, key, nonce, keys);

  Block tag{};
  std::copy(sealed.begin() + static_cast<std::ptrdiff_t>(body_size), sealed.end(), tag.begin());
  std::vector<uint8_t> plaintext(body_size);
  ApplyKeystream(*provider, keys, tag, sealed.first(body_size), plaintext);

  const Block expected = ComputeTag(*provider, keys, nonce, aad, plaintext);
  if (!ct::CompareEqual(expected, tag)) {
    security::Zeroizer::WipeVector(plaintext);
    throw zf::AuthenticationFailureError("AES-GCM-SIV authentication failed");
  }
  return plaintext;
}

}  // namespace zf::crypto
