#include "zf/format/codec.h"

#include <cstring>
#include <string>

#include "zf/common.h"
#include "zf/error.h"
#include "zf/errors.h"

namespace zf::format {

void ThrowMalformed(std::string_view kind, std::string_view detail) {
  std::string message(kind);
  message.append(": ");
  message.append(detail);
  throw zf::Error(zf::ErrorDomain::Format, zf::errors::format::kMalformedHeader, std::move(message));
}

void ByteWriter::PutU8(uint8_t value) { buffer_.push_back(value); }

void ByteWriter::PutU16(uint16_t value) {
  const uint16_t be = zf::ToBigEndian16(value);
  PutBytes(zf::AsBytesConst(be));
}

void ByteWriter::PutU32(uint32_t value) {
  const uint32_t be = zf::ToBigEndian32(value);
  PutBytes(zf::AsBytesConst(be));
}

void ByteWriter::PutU64(uint64_t value) {
  const uint64_t be = zf::ToBigEndian64(value);
  PutBytes(zf::AsBytesConst(be));
}

void ByteWriter::PutBytes(std::span<const uint8_t> bytes) {
  buffer_.insert(buffer_.end(), bytes.begin(), bytes.end());
}

size_t ByteWriter::BeginFrame(uint32_t magic, std::optional<uint8_t> version) {
  const size_t offset = buffer_.size();
  PutU32(magic);
  PutU64(0);
  if (version) {
    PutU8(*version);
  }
  return offset;
}

void ByteWriter::EndFrame(size_t frame_offset) {
  const uint64_t length_be = zf::ToBigEndian64(static_cast<uint64_t>(buffer_.size() - frame_offset));
  std::memcpy(buffer_.data() + frame_offset + kMagicSize, &length_be, sizeof(length_be));
}

std::span<const uint8_t> ByteReader::Bytes(size_t count) {
  if (count > remaining()) {
    ThrowMalformed(kind_, zf::errors::msg::kHeaderTruncated);
  }
  auto out = input_.subspan(offset_, count);
  offset_ += count;
  return out;
}

std::span<const uint8_t> ByteReader::Rest() { return Bytes(remaining()); }

uint8_t ByteReader::U8() { return Bytes(1)[0]; }

uint16_t ByteReader::U16() {
  uint16_t value = 0;
  std::memcpy(&value, Bytes(sizeof(value)).data(), sizeof(value));
  return zf::FromBigEndian16(value);
}

uint32_t ByteReader::U32() {
  uint32_t value = 0;
  std::memcpy(&value, Bytes(sizeof(value)).data(), sizeof(value));
  return zf::FromBigEndian32(value);
}

uint64_t ByteReader::U64() {
  uint64_t value = 0;
  std::memcpy(&value, Bytes(sizeof(value)).data(), sizeof(value));
  return zf::FromBigEndian64(value);
}

namespace {

FrameView OpenPrefix(std::span<const uint8_t> input, uint32_t expected_magic, size_t prefix_size,
                     std::string_view kind) {
  if (input.size() < prefix_size) {
    ThrowMalformed(kind, zf::errors::msg::kHeaderTruncated);
  }
  ByteReader reader(input, kind);
  FrameView view;
  view.magic = reader.U32();
  if (view.magic != expected_magic) {
    ThrowMalformed(kind, zf::errors::msg::kHeaderMagicMismatch);
  }
  view.length = reader.U64();
  if (view.length < prefix_size || view.length > input.size()) {
    ThrowMalformed(kind, zf::errors::msg::kHeaderLengthInvalid);
  }
  return view;
}

}  // namespace

FrameView OpenFrame(std::span<const uint8_t> input, uint32_t expected_magic, uint8_t max_version,
                    std::string_view kind) {
  FrameView view = OpenPrefix(input, expected_magic, kFramePrefixSize, kind);
  view.version = input[kUnversionedPrefixSize];
  if (view.version == 0) {
    ThrowMalformed(kind, zf::errors::msg::kHeaderVersionZero);
  }
  if (view.version > max_version) {
    throw zf::Error(zf::ErrorDomain::Format, zf::errors::format::kUnsupportedVersion,
                    std::string(kind) + ": " + std::string(zf::errors::msg::kHeaderVersionUnsupported) +
                        " (" + std::to_string(view.version) + " > " + std::to_string(max_version) + ")");
  }
  view.payload = input.subspan(kFramePrefixSize, static_cast<size_t>(view.length) - kFramePrefixSize);
  return view;
}

FrameView OpenUnversionedFrame(std::span<const uint8_t> input, uint32_t expected_magic,
                               std::string_view kind) {
  FrameView view = OpenPrefix(input, expected_magic, kUnversionedPrefixSize, kind);
  view.payload =
      input.subspan(kUnversionedPrefixSize, static_cast<size_t>(view.length) - kUnversionedPrefixSize);
  return view;
}

void ExpectFullyConsumed(const ByteReader& reader) {
  if (!reader.empty()) {
    ThrowMalformed(reader.kind(), zf::errors::msg::kHeaderTrailingBytes);
  }
}

std::optional<uint32_t> PeekMagic(std::span<const uint8_t> input) noexcept {
  if (input.size() < kMagicSize) {
    return std::nullopt;
  }
  uint32_t value = 0;
  std::memcpy(&value, input.data(), sizeof(value));
  return zf::FromBigEndian32(value);
}

std::optional<uint64_t> PeekFrameLength(std::span<const uint8_t> input) noexcept {
  if (input.size() < kUnversionedPrefixSize) {
    return std::nullopt;
  }
  uint64_t value = 0;
  std::memcpy(&value, input.data() + kMagicSize, sizeof(value));
  return zf::FromBigEndian64(value);
}

}  // namespace zf::format
