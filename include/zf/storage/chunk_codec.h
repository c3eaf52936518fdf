#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "zf/compression/compressor.h"
#include "zf/crypto/aes_gcm_siv.h"
#include "zf/crypto/provider.h"
#include "zf/format/segment_headers.h"
#include "zf/hash/digest.h"

namespace zf::storage {

struct ChunkEncryption {
  crypto::AeadAlgorithm algorithm{crypto::AeadAlgorithm::kAes256GcmSiv};
  std::vector<uint8_t> content_key;
};

struct ChunkCodecSettings {
  uint64_t container_id{0};
  uint64_t chunk_size{0};
  compression::CompressionAlgorithm compression{compression::CompressionAlgorithm::kNone};
  int compression_level{0};
  std::vector<hash::HashAlgorithm> chunk_hashes;
  std::optional<ChunkEncryption> encryption;
  // Ed25519 seed; when set every sealed chunk carries a signature.
  std::optional<std::array<uint8_t, crypto::kEd25519KeySize>> signing_key;
  // When set, Open requires a valid signature on every chunk.
  std::optional<std::array<uint8_t, crypto::kEd25519KeySize>> verify_key;
};

struct SealedChunk {
  format::ChunkHeader header;
  std::vector<uint8_t> payload;
};

// Nonce of chunk |chunk_number|: the number as u64 big-endian then four zero
// bytes. Header nonces never end in four zero bytes.
std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> ChunkNonce(uint64_t chunk_number);
std::array<uint8_t, 16> ChunkAssociatedData(uint64_t container_id, uint64_t chunk_number);

// Bytes covered by a chunk signature: the associated data followed by the
// plaintext.
std::vector<uint8_t> ChunkSignedMessage(uint64_t container_id, uint64_t chunk_number,
                                        std::span<const uint8_t> plaintext);

uint32_t ChunkCrc32(std::span<const uint8_t> plaintext) noexcept;

// Per-chunk transform: compress, then encrypt; CRC32, digests and signature
// cover the plaintext. A chunk that does not shrink is stored raw and its
// compressed flag stays clear. Stateless apart from the settings, so one
// instance may be shared by worker threads.
class ChunkCodec {
public:
  explicit ChunkCodec(ChunkCodecSettings settings);
  ~ChunkCodec();

  ChunkCodec(const ChunkCodec&) = delete;
  ChunkCodec& operator=(const ChunkCodec&) = delete;

  // |read_error| marks a chunk whose source bytes could not be read and were
  // replaced by zeros.
  SealedChunk Seal(uint64_t chunk_number, std::span<const uint8_t> plaintext, bool read_error = false) const;

  // Throws zf::Error with kDecryptionFailed, kDecompressionFailed,
  // kIntegrityViolation or kSignatureInvalid; the chunk number is on the
  // context stack.
  std::vector<uint8_t> Open(const format::ChunkHeader& header, std::span<const uint8_t> payload) const;

  [[nodiscard]] const ChunkCodecSettings& settings() const noexcept { return settings_; }

private:
  ChunkCodecSettings settings_;
};

}  // namespace zf::storage
