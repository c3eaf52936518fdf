#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "zf/compression/compressor.h"
#include "zf/crypto/aes_gcm_siv.h"
#include "zf/crypto/key_wrap.h"
#include "zf/format/description_header.h"
#include "zf/hash/digest.h"

namespace zf::orchestrator {

inline constexpr uint64_t kDefaultChunkSize = 32 * 1024;
inline constexpr int kDefaultCompressionLevel = 3;
inline constexpr uint16_t kDefaultPbkdf2Iterations = 50'000;
inline constexpr uint64_t kMaxChunkSize = 64ull * 1024 * 1024;
inline constexpr unsigned kMaxWorkerThreads = 256;

struct ScryptCost {
  uint8_t log_n{15};
  uint32_t r{8};
  uint32_t p{1};
};

struct WriterOptions {
  uint64_t chunk_size{kDefaultChunkSize};
  uint64_t split_size{0};  // 0 keeps everything in one segment
  compression::CompressionAlgorithm compression{compression::CompressionAlgorithm::kZstd};
  int compression_level{kDefaultCompressionLevel};
  std::vector<hash::HashAlgorithm> image_hashes{hash::HashAlgorithm::kBlake2b512};
  std::vector<hash::HashAlgorithm> chunk_hashes{hash::HashAlgorithm::kSha3_256};

  std::optional<std::string> passphrase;
  crypto::AeadAlgorithm aead{crypto::AeadAlgorithm::kAes256GcmSiv};
  crypto::PbeScheme pbe_scheme{crypto::PbeScheme::kAes256Cbc};
  crypto::KdfScheme kdf{crypto::KdfScheme::kPbkdf2Sha256};
  uint16_t pbkdf2_iterations{kDefaultPbkdf2Iterations};
  ScryptCost scrypt{};
  bool encrypt_header{true};  // only consulted when a passphrase is set

  // Ed25519 seed (RFC 8032 private key). When set every chunk is signed and
  // the main header records the signature flag.
  std::optional<std::array<uint8_t, crypto::kEd25519KeySize>> signing_key;

  format::DescriptionHeader description;
  unsigned worker_threads{1};
};

struct ReaderOptions {
  std::optional<std::string> passphrase;
  // When set, every chunk must carry a signature that verifies under it.
  std::optional<std::array<uint8_t, crypto::kEd25519KeySize>> verify_key;
  bool fail_fast{false};
};

// Throws zf::Error(kInvalidConfiguration) naming the offending option.
void ValidateWriterOptions(const WriterOptions& options);

// Layers ZF_CHUNK_SIZE, ZF_SPLIT_SIZE, ZF_COMPRESSION, ZF_COMPRESSION_LEVEL,
// ZF_PBKDF2_ITERATIONS and ZF_WORKER_THREADS over |options|. Unparseable
// values throw kInvalidConfiguration rather than being ignored.
WriterOptions ApplyEnvironmentOverrides(WriterOptions options);

}  // namespace zf::orchestrator
