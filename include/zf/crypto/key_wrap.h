#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string_view>
#include <variant>
#include <vector>

#include "zf/crypto/provider.h"

namespace zf::crypto {

inline constexpr size_t kKdfSaltSize = 32;
inline constexpr size_t kPbeIvSize = kAesBlockSize;
// N = 2^30 already needs 128 GiB per unit of r.
inline constexpr uint8_t kMaxScryptLogN = 30;

// Tag values are part of the PBE Header wire format.
enum class KdfScheme : uint8_t {
  kPbkdf2Sha256 = 0,
  kScrypt = 1,
};

enum class PbeScheme : uint8_t {
  kAes128Cbc = 0,
  kAes256Cbc = 1,
};

struct Pbkdf2Parameters {
  uint16_t iterations{0};
  std::array<uint8_t, kKdfSaltSize> salt{};

  bool operator==(const Pbkdf2Parameters&) const = default;
};

struct ScryptParameters {
  uint8_t log_n{0};
  uint32_t r{0};
  uint32_t p{0};
  std::array<uint8_t, kKdfSaltSize> salt{};

  bool operator==(const ScryptParameters&) const = default;
};

using KdfParameters = std::variant<Pbkdf2Parameters, ScryptParameters>;

KdfScheme SchemeOf(const KdfParameters& params) noexcept;
bool IsKnownKdfScheme(uint8_t tag) noexcept;
bool IsKnownPbeScheme(uint8_t tag) noexcept;
size_t PbeKeySize(PbeScheme scheme) noexcept;

// Fresh parameters with a random salt.
KdfParameters NewPbkdf2Parameters(uint16_t iterations);
KdfParameters NewScryptParameters(uint8_t log_n, uint32_t r, uint32_t p);

// Key-encryption key of PbeKeySize(scheme) bytes.
std::vector<uint8_t> DeriveKeyEncryptionKey(std::string_view passphrase,
                                            const KdfParameters& params,
                                            PbeScheme scheme);

std::vector<uint8_t> WrapContentKey(std::string_view passphrase,
                                    const KdfParameters& params,
                                    PbeScheme scheme,
                                    std::span<const uint8_t, kPbeIvSize> iv,
                                    std::span<const uint8_t> content_key);

// Throws zf::Error(kKeyUnwrapFailed) when the padding does not verify or the
// recovered key is not |expected_key_size| bytes long.
std::vector<uint8_t> UnwrapContentKey(std::string_view passphrase,
                                      const KdfParameters& params,
                                      PbeScheme scheme,
                                      std::span<const uint8_t, kPbeIvSize> iv,
                                      std::span<const uint8_t> wrapped_key,
                                      size_t expected_key_size);

}  // namespace zf::crypto
