#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <vector>

namespace zf::crypto {

inline constexpr size_t kAesBlockSize = 16;
inline constexpr size_t kEd25519KeySize = 32;
inline constexpr size_t kEd25519SignatureSize = 64;

using Ed25519Signature = std::array<uint8_t, kEd25519SignatureSize>;

enum class DigestAlgorithm : uint8_t {
  kSha256,
  kSha512,
  kSha3_256,
  kBlake2b512,
};

size_t DigestSize(DigestAlgorithm algorithm) noexcept;

// Incremental message digest. Finalize() may be called once.
class DigestContext {
public:
  virtual ~DigestContext() = default;
  virtual void Update(std::span<const uint8_t> data) = 0;
  virtual std::vector<uint8_t> Finalize() = 0;
};

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  // Raw AES (ECB) over whole blocks. |key| is 16 or 32 bytes; |input| and
  // |output| have the same size, a multiple of kAesBlockSize.
  virtual void EncryptAESBlocks(std::span<const uint8_t> key,
                                std::span<const uint8_t> input,
                                std::span<uint8_t> output) = 0;

  // AES-CBC with PKCS#7 padding. |key| is 16 or 32 bytes.
  virtual std::vector<uint8_t> EncryptAESCBC(std::span<const uint8_t> key,
                                             std::span<const uint8_t, kAesBlockSize> iv,
                                             std::span<const uint8_t> plaintext) = 0;

  // Returns std::nullopt when the padding does not verify, which is the
  // usual outcome of decrypting under the wrong key.
  virtual std::optional<std::vector<uint8_t>> DecryptAESCBC(
      std::span<const uint8_t> key,
      std::span<const uint8_t, kAesBlockSize> iv,
      std::span<const uint8_t> ciphertext) = 0;

  virtual std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) = 0;

  virtual std::unique_ptr<DigestContext> NewDigest(DigestAlgorithm algorithm) = 0;

  virtual std::vector<uint8_t> Scrypt(std::span<const uint8_t> password,
                                      std::span<const uint8_t> salt,
                                      uint64_t n, uint32_t r, uint32_t p,
                                      size_t output_size) = 0;

  // |private_key| is the 32-byte RFC 8032 seed.
  virtual Ed25519Signature Ed25519Sign(std::span<const uint8_t, kEd25519KeySize> private_key,
                                       std::span<const uint8_t> message) = 0;
  virtual std::array<uint8_t, kEd25519KeySize> Ed25519PublicKey(
      std::span<const uint8_t, kEd25519KeySize> private_key) = 0;
  // False for a signature that does not verify; throws only when the
  // public key itself is unusable.
  virtual bool Ed25519Verify(std::span<const uint8_t, kEd25519KeySize> public_key,
                             std::span<const uint8_t> message,
                             std::span<const uint8_t, kEd25519SignatureSize> signature) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  void EncryptAESBlocks(std::span<const uint8_t> key,
                        std::span<const uint8_t> input,
                        std::span<uint8_t> output) override;

  std::vector<uint8_t> EncryptAESCBC(std::span<const uint8_t> key,
                                     std::span<const uint8_t, kAesBlockSize> iv,
                                     std::span<const uint8_t> plaintext) override;

  std::optional<std::vector<uint8_t>> DecryptAESCBC(
      std::span<const uint8_t> key,
      std::span<const uint8_t, kAesBlockSize> iv,
      std::span<const uint8_t> ciphertext) override;

  std::array<uint8_t, 32> HMACSHA256(
      std::span<const uint8_t> key,
      std::span<const uint8_t> message) override;

  std::unique_ptr<DigestContext> NewDigest(DigestAlgorithm algorithm) override;

  std::vector<uint8_t> Scrypt(std::span<const uint8_t> password,
                              std::span<const uint8_t> salt,
                              uint64_t n, uint32_t r, uint32_t p,
                              size_t output_size) override;

  Ed25519Signature Ed25519Sign(std::span<const uint8_t, kEd25519KeySize> private_key,
                               std::span<const uint8_t> message) override;
  std::array<uint8_t, kEd25519KeySize> Ed25519PublicKey(
      std::span<const uint8_t, kEd25519KeySize> private_key) override;
  bool Ed25519Verify(std::span<const uint8_t, kEd25519KeySize> public_key,
                     std::span<const uint8_t> message,
                     std::span<const uint8_t, kEd25519SignatureSize> signature) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized();  // AES known-answer test, once per process
void ResetCryptoProviderForTesting();

}  // namespace zf::crypto
