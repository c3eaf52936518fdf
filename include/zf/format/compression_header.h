#pragma once

#include <cstdint>
#include <span>
#include <vector>

#include "zf/compression/compressor.h"
#include "zf/format/codec.h"

namespace zf::format {

struct CompressionHeader {
  static constexpr uint8_t kVersion = 1;

  compression::CompressionAlgorithm algorithm{compression::CompressionAlgorithm::kNone};
  uint8_t level{0};

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<CompressionHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const CompressionHeader&) const = default;
};

}  // namespace zf::format
