#include "zf/format/description_header.h"

#include <array>
#include <string_view>

#include "zf/common.h"
#include "zf/errors.h"

namespace zf::format {

namespace {

constexpr std::string_view kKind{"description header"};
constexpr std::string_view kCaseNumberTag{"cn"};
constexpr std::string_view kEvidenceNumberTag{"ev"};
constexpr std::string_view kExaminerTag{"ex"};
constexpr std::string_view kNotesTag{"no"};
constexpr std::string_view kAcquisitionDateTag{"ad"};

void PutField(ByteWriter& writer, std::string_view tag, std::span<const uint8_t> value) {
  writer.PutBytes(zf::AsBytes(tag));
  writer.PutU64(value.size());
  writer.PutBytes(value);
}

void PutStringField(ByteWriter& writer, std::string_view tag, const std::optional<std::string>& value) {
  if (value && !value->empty()) {
    PutField(writer, tag, zf::AsBytes(*value));
  }
}

template <class T>
void AssignOnce(std::optional<T>& slot, T value) {
  if (slot) {
    ThrowMalformed(kKind, zf::errors::msg::kDuplicateDescriptionTag);
  }
  slot = std::move(value);
}

}  // namespace

void DescriptionHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kDescriptionHeaderMagic, kVersion);
  PutStringField(writer, kCaseNumberTag, case_number);
  PutStringField(writer, kEvidenceNumberTag, evidence_number);
  PutStringField(writer, kExaminerTag, examiner);
  PutStringField(writer, kNotesTag, notes);
  if (acquisition_date) {
    const uint64_t be = zf::ToBigEndian64(*acquisition_date);
    PutField(writer, kAcquisitionDateTag, zf::AsBytesConst(be));
  }
  writer.EndFrame(frame);
}

Decoded<DescriptionHeader> DescriptionHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kDescriptionHeaderMagic, kVersion, kKind);
  ByteReader reader(frame.payload, kKind);
  DescriptionHeader header;
  while (!reader.empty()) {
    const auto tag_bytes = reader.Bytes(2);
    const std::string_view tag(reinterpret_cast<const char*>(tag_bytes.data()), tag_bytes.size());
    const uint64_t length = reader.U64();
    if (length > reader.remaining()) {
      ThrowMalformed(kKind, zf::errors::msg::kHeaderTruncated);
    }
    const auto value = reader.Bytes(static_cast<size_t>(length));
    // Unset fields are omitted, so a present text field is never empty.
    if (value.empty() && tag != kAcquisitionDateTag) {
      ThrowMalformed(kKind, zf::errors::msg::kEmptyDescriptionValue);
    }
    const std::string text(value.begin(), value.end());
    if (tag == kCaseNumberTag) {
      AssignOnce(header.case_number, text);
    } else if (tag == kEvidenceNumberTag) {
      AssignOnce(header.evidence_number, text);
    } else if (tag == kExaminerTag) {
      AssignOnce(header.examiner, text);
    } else if (tag == kNotesTag) {
      AssignOnce(header.notes, text);
    } else if (tag == kAcquisitionDateTag) {
      if (value.size() != sizeof(uint64_t)) {
        ThrowMalformed(kKind, zf::errors::msg::kAcquisitionDateLength);
      }
      ByteReader date_reader(value, kKind);
      AssignOnce(header.acquisition_date, date_reader.U64());
    } else {
      ThrowMalformed(kKind, zf::errors::msg::kUnknownDescriptionTag);
    }
  }
  return {std::move(header), static_cast<size_t>(frame.length)};
}

}  // namespace zf::format
