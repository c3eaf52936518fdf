#include "zf/crypto/provider.h"

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/hmac.h>

#include <algorithm>
#include <array>
#include <limits>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

#include "zf/crypto/ct.h"
#include "zf/error.h"
#include "zf/orchestrator/event_bus.h"
#include "zf/security/zeroizer.h"

namespace zf::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message, int native = 0) {
  throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure, message,
                  native == 0 ? std::nullopt : std::optional<int>(native));
}

// "<call>: <first queued OpenSSL reason>", draining the rest of the queue.
std::string BuildOpenSSLErrorMessage(const char* call) {
  const unsigned long first = ERR_get_error();
  ERR_clear_error();
  std::string reason = "unknown OpenSSL error";
  if (first != 0) {
    std::array<char, 256> text{};
    ERR_error_string_n(first, text.data(), text.size());
    reason = text.data();
  }
  return std::string(call) + ": " + reason;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
  void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
  void operator()(EVP_PKEY* key) const noexcept { EVP_PKEY_free(key); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;
using DigestCtxPtr = std::unique_ptr<EVP_MD_CTX, EVPContextDeleter>;
using PKeyPtr = std::unique_ptr<EVP_PKEY, EVPContextDeleter>;

PKeyPtr Ed25519PrivateKeyFromSeed(std::span<const uint8_t, kEd25519KeySize> seed) {
  PKeyPtr key(EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed.data(), seed.size()));
  if (!key) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_new_raw_private_key(ED25519)"));
  }
  return key;
}

// a * b + c, or nullopt when the result does not fit in 64 bits.
std::optional<uint64_t> CheckedMulAdd(uint64_t a, uint64_t b, uint64_t c) {
  if (a != 0 && b > std::numeric_limits<uint64_t>::max() / a) {
    return std::nullopt;
  }
  const uint64_t product = a * b;
  if (product > std::numeric_limits<uint64_t>::max() - c) {
    return std::nullopt;
  }
  return product + c;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

const EVP_CIPHER* SelectEcbCipher(size_t key_size) {
  switch (key_size) {
    case 16:
      return EVP_aes_128_ecb();
    case 32:
      return EVP_aes_256_ecb();
    default:
      ThrowCryptoError("Unsupported AES key size " + std::to_string(key_size));
  }
}

const EVP_CIPHER* SelectCbcCipher(size_t key_size) {
  switch (key_size) {
    case 16:
      return EVP_aes_128_cbc();
    case 32:
      return EVP_aes_256_cbc();
    default:
      ThrowCryptoError("Unsupported AES key size " + std::to_string(key_size));
  }
}

const EVP_MD* SelectDigest(DigestAlgorithm algorithm) {
  switch (algorithm) {
    case DigestAlgorithm::kSha256:
      return EVP_sha256();
    case DigestAlgorithm::kSha512:
      return EVP_sha512();
    case DigestAlgorithm::kSha3_256:
      return EVP_sha3_256();
    case DigestAlgorithm::kBlake2b512:
      return EVP_blake2b512();
  }
  ThrowCryptoError("Unsupported digest algorithm");
}

class OpenSSLDigestContext final : public DigestContext {
public:
  explicit OpenSSLDigestContext(DigestAlgorithm algorithm)
      : ctx_(EVP_MD_CTX_new()), size_(DigestSize(algorithm)) {
    if (!ctx_) {
      ThrowCryptoError("Failed to allocate digest context");
    }
    if (EVP_DigestInit_ex(ctx_.get(), SelectDigest(algorithm), nullptr) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestInit_ex"));
    }
  }

  void Update(std::span<const uint8_t> data) override {
    if (finalized_) {
      throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                      "Digest updated after finalization");
    }
    if (data.empty()) {
      return;
    }
    if (EVP_DigestUpdate(ctx_.get(), data.data(), data.size()) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestUpdate"));
    }
  }

  std::vector<uint8_t> Finalize() override {
    if (finalized_) {
      throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                      "Digest finalized twice");
    }
    finalized_ = true;
    std::vector<uint8_t> out(EVP_MAX_MD_SIZE);
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestFinal_ex"));
    }
    if (len != size_) {
      ThrowCryptoError("Unexpected digest length", static_cast<int>(len));
    }
    out.resize(len);
    return out;
  }

private:
  DigestCtxPtr ctx_;
  size_t size_;
  bool finalized_{false};
};

void RunAESKnownAnswerTest() {
  // FIPS-197 appendix C.1 and C.3.
  static constexpr std::array<uint8_t, 32> kKey{
      0x00, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08, 0x09, 0x0a, 0x0b, 0x0c, 0x0d, 0x0e, 0x0f,
      0x10, 0x11, 0x12, 0x13, 0x14, 0x15, 0x16, 0x17, 0x18, 0x19, 0x1a, 0x1b, 0x1c, 0x1d, 0x1e, 0x1f};
  static constexpr std::array<uint8_t, 16> kPlaintext{
      0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77, 0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
  static constexpr std::array<uint8_t, 16> kExpected128{
      0x69, 0xc4, 0xe0, 0xd8, 0x6a, 0x7b, 0x04, 0x30, 0xd8, 0xcd, 0xb7, 0x80, 0x70, 0xb4, 0xc5, 0x5a};
  static constexpr std::array<uint8_t, 16> kExpected256{
      0x8e, 0xa2, 0xb7, 0xca, 0x51, 0x67, 0x45, 0xbf, 0xea, 0xfc, 0x49, 0x90, 0x4b, 0x49, 0x60, 0x89};

  OpenSSLCryptoProvider provider;
  std::array<uint8_t, 16> out{};
  provider.EncryptAESBlocks(std::span<const uint8_t>(kKey.data(), 16), kPlaintext, out);
  if (!ct::CompareEqual(out, kExpected128)) {
    ThrowCryptoError("AES-128 KAT mismatch");
  }
  provider.EncryptAESBlocks(kKey, kPlaintext, out);
  if (!ct::CompareEqual(out, kExpected256)) {
    ThrowCryptoError("AES-256 KAT mismatch");
  }
}

// The self-test runs once per process. A failure propagates from every call
// because std::call_once retries after an exception.
void EnsureCryptoRuntimeConfigured() {
  static std::once_flag self_test;
  std::call_once(self_test, []() {
    RunAESKnownAnswerTest();
    zf::orchestrator::Event event;
    event.category = zf::orchestrator::EventCategory::kDiagnostics;
    event.severity = zf::orchestrator::EventSeverity::kDebug;
    event.event_id = "crypto_runtime_ready";
    event.message = "AES known-answer test passed";
    event.fields.emplace_back("openssl", OpenSSL_version(OPENSSL_VERSION));
    zf::orchestrator::EventBus::Instance().Publish(event);
  });
}

}  // namespace

size_t DigestSize(DigestAlgorithm algorithm) noexcept {
  switch (algorithm) {
    case DigestAlgorithm::kSha256:
    case DigestAlgorithm::kSha3_256:
      return 32;
    case DigestAlgorithm::kSha512:
    case DigestAlgorithm::kBlake2b512:
      return 64;
  }
  return 0;
}

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

void OpenSSLCryptoProvider::EncryptAESBlocks(std::span<const uint8_t> key,
                                             std::span<const uint8_t> input,
                                             std::span<uint8_t> output) {
  if (input.size() % kAesBlockSize != 0 || output.size() != input.size()) {
    ThrowCryptoError("AES block input must be whole blocks");
  }
  if (input.empty()) {
    return;
  }
  if (input.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
    ThrowCryptoError("AES block input too large");
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES context");
  }
  if (EVP_EncryptInit_ex(ctx.get(), SelectEcbCipher(key.size()), nullptr, key.data(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex ecb"));
  }
  EVP_CIPHER_CTX_set_padding(ctx.get(), 0);
  int len = 0;
  if (EVP_EncryptUpdate(ctx.get(), output.data(), &len, input.data(),
                        static_cast<int>(input.size())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate ecb"));
  }
  int final_len = 0;
  if (EVP_EncryptFinal_ex(ctx.get(), output.data() + len, &final_len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex ecb"));
  }
  if (static_cast<size_t>(len + final_len) != input.size()) {
    ThrowCryptoError("AES block output length mismatch");
  }
}

std::vector<uint8_t> OpenSSLCryptoProvider::EncryptAESCBC(
    std::span<const uint8_t> key,
    std::span<const uint8_t, kAesBlockSize> iv,
    std::span<const uint8_t> plaintext) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }
  if (EVP_EncryptInit_ex(ctx.get(), SelectCbcCipher(key.size()), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex cbc"));
  }
  std::vector<uint8_t> out(plaintext.size() + kAesBlockSize);
  int len = 0;
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), out.data(), &len, plaintext.data(),
                          static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate cbc"));
    }
    total = len;
  }
  if (EVP_EncryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex cbc"));
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

std::optional<std::vector<uint8_t>> OpenSSLCryptoProvider::DecryptAESCBC(
    std::span<const uint8_t> key,
    std::span<const uint8_t, kAesBlockSize> iv,
    std::span<const uint8_t> ciphertext) {
  if (ciphertext.empty() || ciphertext.size() % kAesBlockSize != 0) {
    return std::nullopt;
  }
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-CBC context");
  }
  if (EVP_DecryptInit_ex(ctx.get(), SelectCbcCipher(key.size()), nullptr, key.data(), iv.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex cbc"));
  }
  std::vector<uint8_t> out(ciphertext.size() + kAesBlockSize);
  int len = 0;
  if (EVP_DecryptUpdate(ctx.get(), out.data(), &len, ciphertext.data(),
                        static_cast<int>(ciphertext.size())) != 1) {
    security::Zeroizer::WipeVector(out);
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate cbc"));
  }
  int total = len;
  if (EVP_DecryptFinal_ex(ctx.get(), out.data() + total, &len) != 1) {
    // Bad padding. Drain the OpenSSL error queue so it does not leak into
    // later diagnostics.
    ERR_clear_error();
    security::Zeroizer::WipeVector(out);
    return std::nullopt;
  }
  total += len;
  out.resize(static_cast<size_t>(total));
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::HMACSHA256(
    std::span<const uint8_t> key,
    std::span<const uint8_t> message) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (HMAC(EVP_sha256(), key.data(), static_cast<int>(key.size()), message.data(),
           message.size(), out.data(), &len) == nullptr) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("HMAC(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected HMAC-SHA256 length", static_cast<int>(len));
  }
  return out;
}

std::unique_ptr<DigestContext> OpenSSLCryptoProvider::NewDigest(DigestAlgorithm algorithm) {
  return std::make_unique<OpenSSLDigestContext>(algorithm);
}

std::vector<uint8_t> OpenSSLCryptoProvider::Scrypt(std::span<const uint8_t> password,
                                                   std::span<const uint8_t> salt,
                                                   uint64_t n, uint32_t r, uint32_t p,
                                                   size_t output_size) {
  // Working set per RFC 7914: 128*r*p for B plus 128*r*(N+2) for V.
  const uint64_t block_bytes = 128ull * r;
  std::optional<uint64_t> max_mem;
  if (n <= std::numeric_limits<uint64_t>::max() - 2) {
    if (const auto v_bytes = CheckedMulAdd(block_bytes, n + 2, 1ull << 20)) {
      max_mem = CheckedMulAdd(block_bytes, p, *v_bytes);
    }
  }
  if (!max_mem) {
    throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure,
                    "scrypt memory requirement overflows: N=" + std::to_string(n) + " r=" + std::to_string(r) +
                        " p=" + std::to_string(p));
  }
  std::vector<uint8_t> out(output_size);
  if (EVP_PBE_scrypt(reinterpret_cast<const char*>(password.data()), password.size(),
                     salt.data(), salt.size(), n, r, p, *max_mem,
                     out.data(), out.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PBE_scrypt"));
  }
  return out;
}

Ed25519Signature OpenSSLCryptoProvider::Ed25519Sign(std::span<const uint8_t, kEd25519KeySize> private_key,
                                                    std::span<const uint8_t> message) {
  const PKeyPtr key = Ed25519PrivateKeyFromSeed(private_key);
  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("EVP_MD_CTX_new failed");
  }
  // Ed25519 is one-shot; the digest argument must be null.
  if (EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestSignInit(ED25519)"));
  }
  Ed25519Signature signature{};
  size_t signature_len = signature.size();
  if (EVP_DigestSign(ctx.get(), signature.data(), &signature_len, message.data(), message.size()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestSign(ED25519)"));
  }
  if (signature_len != signature.size()) {
    ThrowCryptoError("Unexpected Ed25519 signature length", static_cast<int>(signature_len));
  }
  return signature;
}

std::array<uint8_t, kEd25519KeySize> OpenSSLCryptoProvider::Ed25519PublicKey(
    std::span<const uint8_t, kEd25519KeySize> private_key) {
  const PKeyPtr key = Ed25519PrivateKeyFromSeed(private_key);
  std::array<uint8_t, kEd25519KeySize> public_key{};
  size_t public_len = public_key.size();
  if (EVP_PKEY_get_raw_public_key(key.get(), public_key.data(), &public_len) != 1 ||
      public_len != public_key.size()) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_get_raw_public_key(ED25519)"));
  }
  return public_key;
}

bool OpenSSLCryptoProvider::Ed25519Verify(std::span<const uint8_t, kEd25519KeySize> public_key,
                                          std::span<const uint8_t> message,
                                          std::span<const uint8_t, kEd25519SignatureSize> signature) {
  PKeyPtr key(EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, public_key.data(), public_key.size()));
  if (!key) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_PKEY_new_raw_public_key(ED25519)"));
  }
  DigestCtxPtr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    ThrowCryptoError("EVP_MD_CTX_new failed");
  }
  if (EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DigestVerifyInit(ED25519)"));
  }
  const int verified =
      EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size());
  // A rejected signature leaves a reason on the queue; it is an answer, not a failure.
  ERR_clear_error();
  return verified == 1;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace zf::crypto
