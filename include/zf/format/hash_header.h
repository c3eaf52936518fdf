#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "zf/format/codec.h"
#include "zf/hash/digest.h"

namespace zf::format {

// One digest entry. |type| is kept as the raw tag so that entries written by
// a newer producer survive a decode/encode cycle unchanged.
struct HashValue {
  static constexpr uint8_t kVersion = 1;

  uint8_t type{static_cast<uint8_t>(hash::HashAlgorithm::kNone)};
  std::vector<uint8_t> digest;

  static HashValue For(hash::HashAlgorithm algorithm, std::vector<uint8_t> digest);

  [[nodiscard]] bool IsKnown() const noexcept { return hash::IsKnownHashAlgorithm(type); }

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<HashValue> Decode(std::span<const uint8_t> input);

  bool operator==(const HashValue&) const = default;
};

struct HashHeader {
  static constexpr uint8_t kVersion = 1;

  std::vector<HashValue> values;

  // Entries with zero-filled digests of the right length; encodes to the
  // same size as the final header.
  static HashHeader Placeholder(std::span<const hash::HashAlgorithm> algorithms);
  static HashHeader FromResults(const std::vector<hash::DigestResult>& results);

  [[nodiscard]] const HashValue* Find(hash::HashAlgorithm algorithm) const noexcept;

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<HashHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const HashHeader&) const = default;
};

}  // namespace zf::format
