#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "zf/format/codec.h"

namespace zf::format {

// Case metadata. An unset field is not written at all.
struct DescriptionHeader {
  static constexpr uint8_t kVersion = 1;

  std::optional<std::string> case_number;      // "cn"
  std::optional<std::string> evidence_number;  // "ev"
  std::optional<std::string> examiner;         // "ex"
  std::optional<std::string> notes;            // "no"
  std::optional<uint64_t> acquisition_date;    // "ad", seconds since the Unix epoch

  void EncodeTo(ByteWriter& writer) const;
  std::vector<uint8_t> Encode() const { return EncodeToVector(*this); }
  static Decoded<DescriptionHeader> Decode(std::span<const uint8_t> input);

  bool operator==(const DescriptionHeader&) const = default;
};

}  // namespace zf::format
