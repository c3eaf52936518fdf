#include "zf/format/hash_header.h"

#include "zf/errors.h"

namespace zf::format {

namespace {
constexpr std::string_view kValueKind{"hash value"};
constexpr std::string_view kHeaderKind{"hash header"};
}

HashValue HashValue::For(hash::HashAlgorithm algorithm, std::vector<uint8_t> digest) {
  HashValue value;
  value.type = static_cast<uint8_t>(algorithm);
  value.digest = std::move(digest);
  return value;
}

void HashValue::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kHashValueMagic, kVersion);
  writer.PutU8(type);
  writer.PutBytes(digest);
  writer.EndFrame(frame);
}

Decoded<HashValue> HashValue::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kHashValueMagic, kVersion, kValueKind);
  ByteReader reader(frame.payload, kValueKind);
  HashValue value;
  value.type = reader.U8();
  const auto digest = reader.Rest();
  if (auto expected = hash::DigestLength(value.type); expected && *expected != digest.size()) {
    ThrowMalformed(kValueKind, zf::errors::msg::kDigestLengthMismatch);
  }
  value.digest.assign(digest.begin(), digest.end());
  return {std::move(value), static_cast<size_t>(frame.length)};
}

HashHeader HashHeader::Placeholder(std::span<const hash::HashAlgorithm> algorithms) {
  HashHeader header;
  for (auto algorithm : algorithms) {
    const auto length = hash::DigestLength(static_cast<uint8_t>(algorithm)).value_or(0);
    header.values.push_back(HashValue::For(algorithm, std::vector<uint8_t>(length, 0)));
  }
  return header;
}

HashHeader HashHeader::FromResults(const std::vector<hash::DigestResult>& results) {
  HashHeader header;
  header.values.reserve(results.size());
  for (const auto& result : results) {
    header.values.push_back(HashValue::For(result.algorithm, result.digest));
  }
  return header;
}

const HashValue* HashHeader::Find(hash::HashAlgorithm algorithm) const noexcept {
  for (const auto& value : values) {
    if (value.type == static_cast<uint8_t>(algorithm)) {
      return &value;
    }
  }
  return nullptr;
}

void HashHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kHashHeaderMagic, kVersion);
  for (const auto& value : values) {
    value.EncodeTo(writer);
  }
  writer.EndFrame(frame);
}

Decoded<HashHeader> HashHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kHashHeaderMagic, kVersion, kHeaderKind);
  HashHeader header;
  size_t offset = 0;
  while (offset < frame.payload.size()) {
    auto decoded = HashValue::Decode(frame.payload.subspan(offset));
    header.values.push_back(std::move(decoded.header));
    offset += decoded.consumed;
  }
  return {std::move(header), static_cast<size_t>(frame.length)};
}

}  // namespace zf::format
