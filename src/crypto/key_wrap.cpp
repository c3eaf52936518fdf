#include "zf/crypto/key_wrap.h"

#include <string>
#include <utility>

#include "zf/common.h"
#include "zf/crypto/pbkdf2.h"
#include "zf/crypto/random.h"
#include "zf/error.h"
#include "zf/errors.h"
#include "zf/security/zeroizer.h"

namespace zf::crypto {

namespace {

template <class... Ts>
struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

[[noreturn]] void ThrowUnwrapFailure(std::string detail) {
  throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kKeyUnwrapFailed,
                  std::string(zf::errors::msg::kKeyUnwrapFailed) + ": " + detail);
}

}  // namespace

KdfScheme SchemeOf(const KdfParameters& params) noexcept {
  return std::holds_alternative<ScryptParameters>(params) ? KdfScheme::kScrypt
                                                          : KdfScheme::kPbkdf2Sha256;
}

bool IsKnownKdfScheme(uint8_t tag) noexcept {
  return tag == static_cast<uint8_t>(KdfScheme::kPbkdf2Sha256) ||
         tag == static_cast<uint8_t>(KdfScheme::kScrypt);
}

bool IsKnownPbeScheme(uint8_t tag) noexcept {
  return tag == static_cast<uint8_t>(PbeScheme::kAes128Cbc) ||
         tag == static_cast<uint8_t>(PbeScheme::kAes256Cbc);
}

size_t PbeKeySize(PbeScheme scheme) noexcept {
  return scheme == PbeScheme::kAes128Cbc ? 16 : 32;
}

KdfParameters NewPbkdf2Parameters(uint16_t iterations) {
  Pbkdf2Parameters params;
  params.iterations = iterations;
  SystemRandomBytes(params.salt);
  return params;
}

KdfParameters NewScryptParameters(uint8_t log_n, uint32_t r, uint32_t p) {
  ScryptParameters params;
  params.log_n = log_n;
  params.r = r;
  params.p = p;
  SystemRandomBytes(params.salt);
  return params;
}

std::vector<uint8_t> DeriveKeyEncryptionKey(std::string_view passphrase,
                                            const KdfParameters& params,
                                            PbeScheme scheme) {
  const auto password = zf::AsBytes(passphrase);
  const size_t key_size = PbeKeySize(scheme);
  return std::visit(
      Overloaded{
          [&](const Pbkdf2Parameters& p) {
            return PBKDF2_HMAC_SHA256(password, p.salt, p.iterations, key_size);
          },
          [&](const ScryptParameters& p) {
            if (p.log_n == 0 || p.log_n > kMaxScryptLogN) {
              throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure,
                              "scrypt log2(N) out of range: " + std::to_string(p.log_n));
            }
            return GetCryptoProviderShared()->Scrypt(password, p.salt, uint64_t{1} << p.log_n,
                                                     p.r, p.p, key_size);
          }},
      params);
}

std::vector<uint8_t> WrapContentKey(std::string_view passphrase,
                                    const KdfParameters& params,
                                    PbeScheme scheme,
                                    std::span<const uint8_t, kPbeIvSize> iv,
                                    std::span<const uint8_t> content_key) {
  auto kek = DeriveKeyEncryptionKey(passphrase, params, scheme);
  security::Zeroizer::ScopeWiper<uint8_t> kek_guard{std::span<uint8_t>(kek)};
  return GetCryptoProviderShared()->EncryptAESCBC(kek, iv, content_key);
}

std::vector<uint8_t> UnwrapContentKey(std::string_view passphrase,
                                      const KdfParameters& params,
                                      PbeScheme scheme,
                                      std::span<const uint8_t, kPbeIvSize> iv,
                                      std::span<const uint8_t> wrapped_key,
                                      size_t expected_key_size) {
  if (wrapped_key.empty() || wrapped_key.size() % kAesBlockSize != 0) {
    ThrowUnwrapFailure("wrapped key is not a whole number of cipher blocks");
  }
  auto kek = DeriveKeyEncryptionKey(passphrase, params, scheme);
  security::Zeroizer::ScopeWiper<uint8_t> kek_guard{std::span<uint8_t>(kek)};
  auto plain = GetCryptoProviderShared()->DecryptAESCBC(kek, iv, wrapped_key);
  if (!plain) {
    ThrowUnwrapFailure("padding check failed");
  }
  if (plain->size() != expected_key_size) {
    security::Zeroizer::WipeVector(*plain);
    ThrowUnwrapFailure("recovered key has length " + std::to_string(plain->size()));
  }
  return std::move(*plain);
}

}  // namespace zf::crypto
