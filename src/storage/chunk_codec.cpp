#include "zf/storage/chunk_codec.h"

#include <cstring>
#include <string>
#include <string_view>

#include <zlib.h>

#include "zf/common.h"
#include "zf/crypto/ct.h"
#include "zf/error.h"
#include "zf/errors.h"
#include "zf/security/zeroizer.h"

namespace zf::storage {

namespace {

std::string ChunkContext(uint64_t chunk_number) {
  return "chunk " + std::to_string(chunk_number);
}

void VerifyChunkDigests(const format::HashHeader& stored, std::span<const uint8_t> plaintext,
                        uint64_t chunk_number) {
  for (const auto& value : stored.values) {
    if (!value.IsKnown() || value.type == static_cast<uint8_t>(hash::HashAlgorithm::kNone)) {
      continue;
    }
    const auto algorithm = static_cast<hash::HashAlgorithm>(value.type);
    const auto computed = hash::Compute(algorithm, plaintext);
    if (!crypto::ct::CompareEqual(computed, value.digest)) {
      zf::Error error(zf::ErrorDomain::Integrity, zf::errors::integrity::kIntegrityViolation,
                      std::string(zf::errors::msg::kChunkDigestMismatch) + " (" +
                          hash::HashAlgorithmName(value.type) + ")");
      error.AddContext(ChunkContext(chunk_number));
      throw error;
    }
  }
}

void VerifyChunkSignature(const ChunkCodecSettings& settings, const format::ChunkHeader& header,
                          std::span<const uint8_t> plaintext) {
  std::string_view failure;
  if (!header.signature) {
    failure = zf::errors::msg::kChunkSignatureMissing;
  } else {
    const auto message = ChunkSignedMessage(settings.container_id, header.chunk_number, plaintext);
    if (!crypto::GetCryptoProvider().Ed25519Verify(*settings.verify_key, message, *header.signature)) {
      failure = zf::errors::msg::kChunkSignatureInvalid;
    }
  }
  if (!failure.empty()) {
    zf::Error error(zf::ErrorDomain::Integrity, zf::errors::integrity::kSignatureInvalid, std::string(failure));
    error.AddContext(ChunkContext(header.chunk_number));
    throw error;
  }
}

}  // namespace

std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> ChunkNonce(uint64_t chunk_number) {
  std::array<uint8_t, crypto::AES_GCM_SIV::NONCE_SIZE> nonce{};
  const uint64_t be = zf::ToBigEndian64(chunk_number);
  std::memcpy(nonce.data(), &be, sizeof(be));
  return nonce;
}

std::array<uint8_t, 16> ChunkAssociatedData(uint64_t container_id, uint64_t chunk_number) {
  std::array<uint8_t, 16> aad{};
  const uint64_t id_be = zf::ToBigEndian64(container_id);
  const uint64_t number_be = zf::ToBigEndian64(chunk_number);
  std::memcpy(aad.data(), &id_be, sizeof(id_be));
  std::memcpy(aad.data() + sizeof(id_be), &number_be, sizeof(number_be));
  return aad;
}

std::vector<uint8_t> ChunkSignedMessage(uint64_t container_id, uint64_t chunk_number,
                                        std::span<const uint8_t> plaintext) {
  const auto aad = ChunkAssociatedData(container_id, chunk_number);
  std::vector<uint8_t> message;
  message.reserve(aad.size() + plaintext.size());
  message.insert(message.end(), aad.begin(), aad.end());
  message.insert(message.end(), plaintext.begin(), plaintext.end());
  return message;
}

uint32_t ChunkCrc32(std::span<const uint8_t> plaintext) noexcept {
  uLong crc = crc32(0L, Z_NULL, 0);
  // Chunks never exceed kMaxChunkSize, well inside uInt.
  crc = crc32(crc, plaintext.data(), static_cast<uInt>(plaintext.size()));
  return static_cast<uint32_t>(crc);
}

ChunkCodec::ChunkCodec(ChunkCodecSettings settings) : settings_(std::move(settings)) {}

ChunkCodec::~ChunkCodec() {
  if (settings_.encryption) {
    security::Zeroizer::WipeVector(settings_.encryption->content_key);
  }
  if (settings_.signing_key) {
    security::Zeroizer::Wipe(*settings_.signing_key);
  }
}

SealedChunk ChunkCodec::Seal(uint64_t chunk_number, std::span<const uint8_t> plaintext, bool read_error) const {
  SealedChunk sealed;
  sealed.header.chunk_number = chunk_number;
  sealed.header.crc32 = ChunkCrc32(plaintext);
  if (read_error) {
    sealed.header.flags |= format::chunk_flags::kReadError;
  }

  hash::MultiHasher hasher(settings_.chunk_hashes);
  hasher.Update(plaintext);
  sealed.header.hashes = format::HashHeader::FromResults(hasher.Finalize());

  if (settings_.signing_key) {
    const auto message = ChunkSignedMessage(settings_.container_id, chunk_number, plaintext);
    sealed.header.signature = crypto::GetCryptoProvider().Ed25519Sign(*settings_.signing_key, message);
    sealed.header.flags |= format::chunk_flags::kSigned;
  }

  std::vector<uint8_t> body;
  if (settings_.compression != compression::CompressionAlgorithm::kNone) {
    body = compression::Compress(settings_.compression, plaintext, settings_.compression_level);
    if (body.size() < plaintext.size()) {
      sealed.header.flags |= format::chunk_flags::kCompressed;
    } else {
      security::Zeroizer::WipeVector(body);
      body.assign(plaintext.begin(), plaintext.end());
    }
  } else {
    body.assign(plaintext.begin(), plaintext.end());
  }

  if (settings_.encryption) {
    const auto nonce = ChunkNonce(chunk_number);
    const auto aad = ChunkAssociatedData(settings_.container_id, chunk_number);
    sealed.payload = crypto::AES_GCM_SIV_Seal(settings_.encryption->algorithm, settings_.encryption->content_key,
                                              nonce, aad, body);
    security::Zeroizer::WipeVector(body);
  } else {
    sealed.payload = std::move(body);
  }
  sealed.header.stored_size = sealed.payload.size();
  return sealed;
}

std::vector<uint8_t> ChunkCodec::Open(const format::ChunkHeader& header, std::span<const uint8_t> payload) const {
  if (payload.size() != header.stored_size) {
    zf::Error error(zf::ErrorDomain::Format, zf::errors::format::kMalformedHeader,
                    std::string(zf::errors::msg::kChunkOverrunsSegment));
    error.AddContext(ChunkContext(header.chunk_number));
    throw error;
  }

  std::vector<uint8_t> compressed;
  if (settings_.encryption) {
    const auto nonce = ChunkNonce(header.chunk_number);
    const auto aad = ChunkAssociatedData(settings_.container_id, header.chunk_number);
    try {
      compressed = crypto::AES_GCM_SIV_Open(settings_.encryption->algorithm, settings_.encryption->content_key,
                                            nonce, aad, payload);
    } catch (const zf::AuthenticationFailureError&) {
      zf::Error error(zf::ErrorDomain::Crypto, zf::errors::crypto::kDecryptionFailed,
                      std::string(zf::errors::msg::kChunkDecryptionFailed));
      error.AddContext(ChunkContext(header.chunk_number));
      throw error;
    }
  } else {
    compressed.assign(payload.begin(), payload.end());
  }
  security::Zeroizer::ScopeWiper<uint8_t> compressed_guard{std::span<uint8_t>(compressed)};

  // Before version 3 every chunk of a compressing container went through the codec.
  const bool stored_compressed = header.version >= format::ChunkHeader::kVersion
                                     ? header.HasFlag(format::chunk_flags::kCompressed)
                                     : settings_.compression != compression::CompressionAlgorithm::kNone;
  std::vector<uint8_t> plaintext;
  try {
    if (stored_compressed && settings_.compression == compression::CompressionAlgorithm::kNone) {
      throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kDecompressionFailed,
                      std::string(zf::errors::msg::kDecompressionFailed) +
                          ": chunk flagged compressed in a container without compression");
    }
    plaintext = compression::Decompress(
        stored_compressed ? settings_.compression : compression::CompressionAlgorithm::kNone, compressed,
        settings_.chunk_size);
  } catch (zf::Error& error) {
    error.AddContext(ChunkContext(header.chunk_number));
    throw;
  }
  if (header.crc32 && ChunkCrc32(plaintext) != *header.crc32) {
    zf::Error error(zf::ErrorDomain::Integrity, zf::errors::integrity::kIntegrityViolation,
                    std::string(zf::errors::msg::kChunkCrcMismatch));
    error.AddContext(ChunkContext(header.chunk_number));
    throw error;
  }
  VerifyChunkDigests(header.hashes, plaintext, header.chunk_number);
  if (settings_.verify_key) {
    VerifyChunkSignature(settings_, header, plaintext);
  }
  return plaintext;
}

}  // namespace zf::storage
