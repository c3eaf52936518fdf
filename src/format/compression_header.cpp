#include "zf/format/compression_header.h"

#include "zf/errors.h"

namespace zf::format {

namespace {
constexpr std::string_view kKind{"compression header"};
}

void CompressionHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kCompressionHeaderMagic, kVersion);
  writer.PutU8(static_cast<uint8_t>(algorithm));
  writer.PutU8(level);
  writer.EndFrame(frame);
}

Decoded<CompressionHeader> CompressionHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kCompressionHeaderMagic, kVersion, kKind);
  ByteReader reader(frame.payload, kKind);
  CompressionHeader header;
  const uint8_t tag = reader.U8();
  if (!compression::IsKnownCompressionAlgorithm(tag)) {
    ThrowMalformed(kKind, zf::errors::msg::kUnknownCompressionAlgorithm);
  }
  header.algorithm = static_cast<compression::CompressionAlgorithm>(tag);
  header.level = reader.U8();
  if (header.algorithm != compression::CompressionAlgorithm::kNone &&
      header.level > compression::MaxCompressionLevel(header.algorithm)) {
    ThrowMalformed(kKind, "compression level above codec maximum");
  }
  ExpectFullyConsumed(reader);
  return {std::move(header), static_cast<size_t>(frame.length)};
}

}  // namespace zf::format
