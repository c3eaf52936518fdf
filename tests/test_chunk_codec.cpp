#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <vector>

#include "test_util.h"
#include "zf/common.h"
#include "zf/crypto/provider.h"
#include "zf/errors.h"
#include "zf/storage/chunk_codec.h"

namespace {

using zf::storage::ChunkCodec;
using zf::storage::ChunkCodecSettings;
using zf::storage::SealedChunk;
using zf::test::CaptureErrorCode;

constexpr uint64_t kChunkSize = 4096;

ChunkCodecSettings BaseSettings(bool encrypted, zf::compression::CompressionAlgorithm compression) {
  ChunkCodecSettings settings;
  settings.container_id = 0xC0FFEE;
  settings.chunk_size = kChunkSize;
  settings.compression = compression;
  settings.compression_level = 3;
  settings.chunk_hashes = {zf::hash::HashAlgorithm::kSha3_256};
  if (encrypted) {
    settings.encryption =
        zf::storage::ChunkEncryption{zf::crypto::AeadAlgorithm::kAes256GcmSiv, zf::test::PatternBytes(32, 99)};
  }
  return settings;
}

std::vector<std::vector<uint8_t>> SamplePlaintexts() {
  std::vector<std::vector<uint8_t>> chunks;
  for (uint32_t i = 0; i < 5; ++i) {
    chunks.push_back(zf::test::PatternBytes(kChunkSize, i + 1));
  }
  chunks.back().resize(100);
  return chunks;
}

void TestNonceAndAssociatedData() {
  [[maybe_unused]] const auto nonce = zf::storage::ChunkNonce(0x0102030405060708ull);
  assert(nonce[0] == 0x01 && nonce[7] == 0x08 && "chunk number is big-endian");
  assert(nonce[8] == 0 && nonce[9] == 0 && nonce[10] == 0 && nonce[11] == 0 && "last four bytes are zero");
  [[maybe_unused]] const auto aad = zf::storage::ChunkAssociatedData(1, 2);
  assert(aad[7] == 1 && aad[15] == 2 && "aad is id then number");
}

void TestRoundTrip() {
  for (bool encrypted : {false, true}) {
    for (auto compression : {zf::compression::CompressionAlgorithm::kNone, zf::compression::CompressionAlgorithm::kZstd,
                             zf::compression::CompressionAlgorithm::kLz4}) {
      ChunkCodec codec(BaseSettings(encrypted, compression));
      const auto plaintexts = SamplePlaintexts();
      for (size_t i = 0; i < plaintexts.size(); ++i) {
        const auto sealed = codec.Seal(i + 1, plaintexts[i]);
        assert(sealed.header.chunk_number == i + 1 && "chunk number recorded");
        assert(sealed.header.stored_size == sealed.payload.size() && "stored size recorded");
        assert(sealed.header.hashes.values.size() == 1 && "one chunk digest");
        [[maybe_unused]] const auto opened = codec.Open(sealed.header, sealed.payload);
        assert(opened == plaintexts[i] && "open(seal(x)) == x");
      }
    }
  }
}

void TestCorruptionIsolated(bool encrypted, int expected_code) {
  ChunkCodec codec(BaseSettings(encrypted, zf::compression::CompressionAlgorithm::kNone));
  const auto plaintexts = SamplePlaintexts();
  std::vector<SealedChunk> sealed;
  for (size_t i = 0; i < plaintexts.size(); ++i) {
    sealed.push_back(codec.Seal(i + 1, plaintexts[i]));
  }
  sealed[2].payload[1000] ^= 0x01;
  for (size_t i = 0; i < sealed.size(); ++i) {
    const int code = CaptureErrorCode([&] { (void)codec.Open(sealed[i].header, sealed[i].payload); });
    if (i == 2) {
      assert(code == expected_code && "mutated chunk reports its failure");
    } else {
      assert(code == -1 && "other chunks are unaffected");
    }
  }
}

void TestErrorContextNamesChunk() {
  ChunkCodec codec(BaseSettings(false, zf::compression::CompressionAlgorithm::kNone));
  auto sealed = codec.Seal(7, zf::test::PatternBytes(64, 7));
  sealed.payload[0] ^= 0xFF;
  bool saw_context = false;
  try {
    (void)codec.Open(sealed.header, sealed.payload);
  } catch (const zf::Error& error) {
    saw_context = error.Describe().find("chunk 7") != std::string::npos;
  }
  assert(saw_context && "integrity error names the chunk");
}

void TestPositionBinding() {
  ChunkCodec codec(BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd));
  const auto first = codec.Seal(1, zf::test::PatternBytes(kChunkSize, 1));
  const auto second = codec.Seal(2, zf::test::PatternBytes(kChunkSize, 2));
  auto swapped = second.header;
  swapped.chunk_number = 1;
  swapped.stored_size = second.payload.size();
  assert(CaptureErrorCode([&] { (void)codec.Open(swapped, second.payload); }) ==
             zf::errors::crypto::kDecryptionFailed &&
         "a chunk moved to another position fails authentication");

  auto other_settings = BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd);
  other_settings.container_id += 1;
  ChunkCodec other(std::move(other_settings));
  assert(CaptureErrorCode([&] { (void)other.Open(first.header, first.payload); }) ==
             zf::errors::crypto::kDecryptionFailed &&
         "a chunk from another container fails authentication");
}

void TestStoredSizeMismatch() {
  ChunkCodec codec(BaseSettings(false, zf::compression::CompressionAlgorithm::kNone));
  auto sealed = codec.Seal(1, zf::test::PatternBytes(32, 1));
  sealed.payload.pop_back();
  assert(CaptureErrorCode([&] { (void)codec.Open(sealed.header, sealed.payload); }) ==
             zf::errors::format::kMalformedHeader &&
         "payload shorter than declared");
}

void TestCrc32() {
  // The standard CRC-32 check value.
  [[maybe_unused]] const uint32_t check = zf::storage::ChunkCrc32(zf::AsBytes("123456789"));
  assert(check == 0xCBF43926u && "CRC-32 check value");

  ChunkCodec codec(BaseSettings(false, zf::compression::CompressionAlgorithm::kZstd));
  const auto plaintext = zf::test::PatternBytes(kChunkSize, 21);
  auto sealed = codec.Seal(3, plaintext);
  assert(sealed.header.crc32 == zf::storage::ChunkCrc32(plaintext) && "CRC covers the plaintext");
  *sealed.header.crc32 ^= 1u;
  assert(CaptureErrorCode([&] { (void)codec.Open(sealed.header, sealed.payload); }) ==
             zf::errors::integrity::kIntegrityViolation &&
         "CRC mismatch is an integrity violation");
}

void TestCompressedFlagAndRawFallback() {
  for (auto compression : {zf::compression::CompressionAlgorithm::kZstd, zf::compression::CompressionAlgorithm::kLz4}) {
    ChunkCodec codec(BaseSettings(false, compression));
    const std::vector<uint8_t> zeros(kChunkSize, 0);
    const auto packed = codec.Seal(1, zeros);
    assert(packed.header.HasFlag(zf::format::chunk_flags::kCompressed) && packed.payload.size() < zeros.size() &&
           "a shrinking chunk is stored compressed");

    const auto noise = zf::test::PatternBytes(kChunkSize, 8);
    const auto raw = codec.Seal(2, noise);
    assert(!raw.header.HasFlag(zf::format::chunk_flags::kCompressed) && "incompressible chunk is stored raw");
    assert(raw.payload == noise && "raw payload is the plaintext");
    assert(codec.Open(raw.header, raw.payload) == noise && "raw chunk opens in a compressing container");
    assert(codec.Open(packed.header, packed.payload) == zeros && "compressed chunk opens");
  }

  ChunkCodec plain(BaseSettings(false, zf::compression::CompressionAlgorithm::kNone));
  auto sealed = plain.Seal(1, std::vector<uint8_t>(kChunkSize, 0));
  assert(!sealed.header.HasFlag(zf::format::chunk_flags::kCompressed) && "no codec, no flag");
  sealed.header.flags |= zf::format::chunk_flags::kCompressed;
  assert(CaptureErrorCode([&] { (void)plain.Open(sealed.header, sealed.payload); }) ==
             zf::errors::codec::kDecompressionFailed &&
         "compressed flag without a codec is rejected");
}

void TestLegacyHeadersDecompressAlways() {
  ChunkCodec codec(BaseSettings(false, zf::compression::CompressionAlgorithm::kZstd));
  const std::vector<uint8_t> zeros(kChunkSize, 0);
  auto sealed = codec.Seal(1, zeros);
  sealed.header.version = zf::format::ChunkHeader::kVersionWithHashes;
  sealed.header.crc32.reset();
  sealed.header.flags = 0;
  assert(codec.Open(sealed.header, sealed.payload) == zeros && "version 2 chunk in a zstd container is compressed");
}

void TestReadErrorFlag() {
  ChunkCodec codec(BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd));
  const std::vector<uint8_t> zeros(kChunkSize, 0);
  const auto unreadable = codec.Seal(4, zeros, true);
  assert(unreadable.header.HasFlag(zf::format::chunk_flags::kReadError) && "read error recorded");
  assert(codec.Open(unreadable.header, unreadable.payload) == zeros && "zero fill is recoverable");
  const auto readable = codec.Seal(5, zeros);
  assert(!readable.header.HasFlag(zf::format::chunk_flags::kReadError) && "no read error by default");
}

void TestSignedChunks() {
  std::array<uint8_t, zf::crypto::kEd25519KeySize> seed{};
  const auto seed_bytes = zf::test::PatternBytes(seed.size(), 31);
  std::copy(seed_bytes.begin(), seed_bytes.end(), seed.begin());
  const auto public_key = zf::crypto::GetCryptoProvider().Ed25519PublicKey(seed);

  auto signing = BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd);
  signing.signing_key = seed;
  ChunkCodec signer(std::move(signing));
  auto verifying = BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd);
  verifying.verify_key = public_key;
  ChunkCodec verifier(std::move(verifying));

  const auto plaintext = zf::test::PatternBytes(kChunkSize, 12);
  const auto sealed = signer.Seal(9, plaintext);
  assert(sealed.header.signature && sealed.header.HasFlag(zf::format::chunk_flags::kSigned) && "chunk signed");
  assert(verifier.Open(sealed.header, sealed.payload) == plaintext && "signature verifies");
  assert(zf::crypto::GetCryptoProvider().Ed25519Verify(
             public_key, zf::storage::ChunkSignedMessage(0xC0FFEE, 9, plaintext), *sealed.header.signature) &&
         "signature covers container id, chunk number and plaintext");

  auto forged = sealed.header;
  (*forged.signature)[0] ^= 0x80;
  assert(CaptureErrorCode([&] { (void)verifier.Open(forged, sealed.payload); }) ==
             zf::errors::integrity::kSignatureInvalid &&
         "altered signature is reported");

  ChunkCodec unsigned_writer(BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd));
  const auto bare = unsigned_writer.Seal(9, plaintext);
  assert(!bare.header.signature && "no key, no signature");
  assert(CaptureErrorCode([&] { (void)verifier.Open(bare.header, bare.payload); }) ==
             zf::errors::integrity::kSignatureInvalid &&
         "missing signature is reported when a key is supplied");

  auto other_seed = seed;
  other_seed[0] ^= 0xFF;
  auto wrong = BaseSettings(true, zf::compression::CompressionAlgorithm::kZstd);
  wrong.verify_key = zf::crypto::GetCryptoProvider().Ed25519PublicKey(other_seed);
  ChunkCodec wrong_verifier(std::move(wrong));
  assert(CaptureErrorCode([&] { (void)wrong_verifier.Open(sealed.header, sealed.payload); }) ==
             zf::errors::integrity::kSignatureInvalid &&
         "signature under another key is rejected");
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();
  TestNonceAndAssociatedData();
  TestRoundTrip();
  TestCorruptionIsolated(false, zf::errors::integrity::kIntegrityViolation);
  TestCorruptionIsolated(true, zf::errors::crypto::kDecryptionFailed);
  TestErrorContextNamesChunk();
  TestPositionBinding();
  TestStoredSizeMismatch();
  TestCrc32();
  TestCompressedFlagAndRawFallback();
  TestLegacyHeadersDecompressAlways();
  TestReadErrorFlag();
  TestSignedChunks();
  std::cout << "chunk codec test ok\n";
  return 0;
}
