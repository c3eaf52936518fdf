#include "zf/format/segment_headers.h"

#include <algorithm>

#include "zf/errors.h"

namespace zf::format {

namespace {
constexpr std::string_view kSplitKind{"split header"};
constexpr std::string_view kChunkKind{"chunk header"};
}

void SplitHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kSplitHeaderMagic, kVersion);
  writer.PutU64(container_id);
  writer.PutU64(split_number);
  writer.PutU64(segment_length);
  writer.EndFrame(frame);
}

Decoded<SplitHeader> SplitHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kSplitHeaderMagic, kVersion, kSplitKind);
  ByteReader reader(frame.payload, kSplitKind);
  SplitHeader header;
  header.container_id = reader.U64();
  header.split_number = reader.U64();
  header.segment_length = reader.U64();
  ExpectFullyConsumed(reader);
  if (header.split_number == 0) {
    ThrowMalformed(kSplitKind, "split number 0 is not valid");
  }
  return {header, static_cast<size_t>(frame.length)};
}

void ChunkHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kChunkHeaderMagic, version);
  writer.PutU64(chunk_number);
  writer.PutU64(stored_size);
  if (version >= kVersion) {
    writer.PutU32(crc32.value_or(0));
    writer.PutU8(signature ? static_cast<uint8_t>(flags | chunk_flags::kSigned)
                           : static_cast<uint8_t>(flags & ~chunk_flags::kSigned));
  }
  if (version >= kVersionWithHashes) {
    hashes.EncodeTo(writer);
  }
  if (version >= kVersion && signature) {
    writer.PutBytes(*signature);
  }
  writer.EndFrame(frame);
}

Decoded<ChunkHeader> ChunkHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kChunkHeaderMagic, kVersion, kChunkKind);
  ByteReader reader(frame.payload, kChunkKind);
  ChunkHeader header;
  header.version = frame.version;
  header.chunk_number = reader.U64();
  header.stored_size = reader.U64();
  if (header.stored_size == 0) {
    ThrowMalformed(kChunkKind, zf::errors::msg::kChunkSizeZero);
  }
  if (frame.version >= kVersion) {
    header.crc32 = reader.U32();
    header.flags = reader.U8();
    if ((header.flags & ~chunk_flags::kDefined) != 0) {
      ThrowMalformed(kChunkKind, zf::errors::msg::kUnknownChunkFlags);
    }
  }
  if (frame.version >= kVersionWithHashes) {
    auto hashes = HashHeader::Decode(frame.payload.subspan(reader.consumed()));
    header.hashes = std::move(hashes.header);
    reader.Bytes(hashes.consumed);
  }
  if (header.HasFlag(chunk_flags::kSigned)) {
    const auto bytes = reader.Bytes(kChunkSignatureSize);
    ChunkSignature signature{};
    std::copy(bytes.begin(), bytes.end(), signature.begin());
    header.signature = signature;
  }
  ExpectFullyConsumed(reader);
  return {std::move(header), static_cast<size_t>(frame.length)};
}

}  // namespace zf::format
