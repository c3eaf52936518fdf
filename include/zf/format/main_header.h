#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "zf/format/codec.h"
#include "zf/format/compression_header.h"
#include "zf/format/description_header.h"
#include "zf/format/encryption_header.h"
#include "zf/format/hash_header.h"
#include "zf/format/segment_headers.h"

namespace zf::format {

enum class EncryptionFlag : uint8_t {
  kNone = 0,
  kChunksOnly = 1,  // plain main header carrying an encryption header
  kFull = 2,        // encrypted main header
};

// Version 2 adds the signature flag; version 1 headers decode as unsigned
// and re-encode as version 1.
struct MainHeader {
  static constexpr uint8_t kVersion = 2;
  static constexpr uint8_t kEncryptedVersion = 2;
  static constexpr uint8_t kVersionWithoutSignatureFlag = 1;

  uint8_t version{kVersion};
  EncryptionFlag encryption_flag{EncryptionFlag::kNone};
  std::optional<EncryptionHeader> encryption;
  CompressionHeader compression;
  DescriptionHeader description;
  HashHeader hashes;
  uint64_t chunk_size{0};
  uint64_t split_size{0};
  SplitHeader split;
  uint64_t data_length{0};
  bool signature_flag{false};  // chunks carry Ed25519 signatures

  // |content_key| is required for EncryptionFlag::kFull and ignored otherwise.
  std::vector<uint8_t> Encode(std::span<const uint8_t> content_key = {}) const;

  // Decodes either framing. For EncryptionFlag::kFull a missing key throws
  // kPassphraseRequired and a failed tag check throws kDecryptionFailed.
  static Decoded<MainHeader> Decode(std::span<const uint8_t> input,
                                    std::span<const uint8_t> content_key = {});

  bool operator==(const MainHeader&) const = default;
};

// Framing of either main header variant, readable without any key.
struct MainHeaderEnvelope {
  uint32_t magic{0};
  uint8_t version{0};
  uint64_t length{0};
  EncryptionFlag encryption_flag{EncryptionFlag::kNone};
  std::optional<EncryptionHeader> encryption;
  size_t body_offset{0};  // offset of the fields after the encryption header
};

MainHeaderEnvelope ReadMainHeaderEnvelope(std::span<const uint8_t> input);

}  // namespace zf::format
