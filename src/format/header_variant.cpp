#include "zf/format/header_variant.h"

#include "zf/errors.h"

namespace zf::format {

namespace {

template <class Header>
Decoded<AnyHeader> Wrap(Decoded<Header> decoded) {
  return {AnyHeader(std::move(decoded.header)), decoded.consumed};
}

}  // namespace

std::string_view HeaderKindName(uint32_t magic) noexcept {
  switch (magic) {
  case kMainHeaderMagic:
    return "main header";
  case kEncryptedMainHeaderMagic:
    return "encrypted main header";
  case kEncryptionHeaderMagic:
    return "encryption header";
  case kPbeHeaderMagic:
    return "pbe header";
  case kKdfParametersMagic:
    return "kdf parameters";
  case kCompressionHeaderMagic:
    return "compression header";
  case kDescriptionHeaderMagic:
    return "description header";
  case kHashHeaderMagic:
    return "hash header";
  case kHashValueMagic:
    return "hash value";
  case kSplitHeaderMagic:
    return "split header";
  case kChunkHeaderMagic:
    return "chunk header";
  default:
    return "unknown";
  }
}

Decoded<AnyHeader> DecodeAnyHeader(std::span<const uint8_t> input, std::span<const uint8_t> content_key) {
  const auto magic = PeekMagic(input);
  if (!magic) {
    ThrowMalformed("header", zf::errors::msg::kHeaderTruncated);
  }
  switch (*magic) {
  case kMainHeaderMagic:
  case kEncryptedMainHeaderMagic:
    return Wrap(MainHeader::Decode(input, content_key));
  case kEncryptionHeaderMagic:
    return Wrap(EncryptionHeader::Decode(input));
  case kPbeHeaderMagic:
    return Wrap(PbeHeader::Decode(input));
  case kCompressionHeaderMagic:
    return Wrap(CompressionHeader::Decode(input));
  case kDescriptionHeaderMagic:
    return Wrap(DescriptionHeader::Decode(input));
  case kHashHeaderMagic:
    return Wrap(HashHeader::Decode(input));
  case kHashValueMagic:
    return Wrap(HashValue::Decode(input));
  case kSplitHeaderMagic:
    return Wrap(SplitHeader::Decode(input));
  case kChunkHeaderMagic:
    return Wrap(ChunkHeader::Decode(input));
  default:
    ThrowMalformed("header", zf::errors::msg::kHeaderMagicMismatch);
  }
}

}  // namespace zf::format
