#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "zf/format/codec.h"
#include "zf/format/hash_header.h"

namespace zf::format {

struct SplitHeader {
  static constexpr uint8_t kVersion = 1;
  static constexpr size_t kEncodedSize = kFramePrefixSize + 3 * sizeof(uint64_t);

  uint64_t container_id{0};
  uint64_t split_number{0};
  uint64_t segment_length{0};

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<SplitHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const SplitHeader&) const = default;
};

// Bits of ChunkHeader::flags.
namespace chunk_flags {
inline constexpr uint8_t kReadError = 0x01;   // source was unreadable; chunk holds zeros
inline constexpr uint8_t kCompressed = 0x02;  // payload went through the container's codec
inline constexpr uint8_t kSigned = 0x04;      // an Ed25519 signature follows the digests
inline constexpr uint8_t kDefined = kReadError | kCompressed | kSigned;
}  // namespace chunk_flags

inline constexpr size_t kChunkSignatureSize = 64;
using ChunkSignature = std::array<uint8_t, kChunkSignatureSize>;

// Version 3 adds a CRC32 of the plaintext, the flag byte and an optional
// signature. Versions 2 (digests, no CRC or flags) and 1 (number and stored
// size only) are still accepted; they decode with flags 0 and no CRC.
struct ChunkHeader {
  static constexpr uint8_t kVersion = 3;
  static constexpr uint8_t kVersionWithHashes = 2;
  static constexpr uint8_t kVersionWithoutHashes = 1;

  uint8_t version{kVersion};
  uint64_t chunk_number{0};
  uint64_t stored_size{0};
  std::optional<uint32_t> crc32;
  uint8_t flags{0};
  HashHeader hashes;
  std::optional<ChunkSignature> signature;

  [[nodiscard]] bool HasFlag(uint8_t flag) const noexcept { return (flags & flag) != 0; }

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<ChunkHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const ChunkHeader&) const = default;
};

}  // namespace zf::format
