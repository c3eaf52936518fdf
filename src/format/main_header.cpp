#include "zf/format/main_header.h"

#include <array>
#include <cstring>
#include <string>

#include "zf/common.h"

#include "zf/error.h"
#include "zf/errors.h"

namespace zf::format {

namespace {

constexpr std::string_view kMainKind{"main header"};
constexpr std::string_view kEncryptedMainKind{"encrypted main header"};

void EncodeInnerFields(ByteWriter& writer, const MainHeader& header) {
  header.compression.EncodeTo(writer);
  header.description.EncodeTo(writer);
  header.hashes.EncodeTo(writer);
  writer.PutU64(header.chunk_size);
  writer.PutU64(header.split_size);
  header.split.EncodeTo(writer);
  writer.PutU64(header.data_length);
  if (header.version > MainHeader::kVersionWithoutSignatureFlag) {
    writer.PutU8(header.signature_flag ? 1 : 0);
  }
}

template <class Header>
Header ReadNested(ByteReader& reader, std::span<const uint8_t> payload) {
  auto decoded = Header::Decode(payload.subspan(reader.consumed()));
  reader.Bytes(decoded.consumed);
  return std::move(decoded.header);
}

void DecodeInnerFields(ByteReader& reader, std::span<const uint8_t> payload, MainHeader& header) {
  // header.version is already set from the frame.
  header.compression = ReadNested<CompressionHeader>(reader, payload);
  header.description = ReadNested<DescriptionHeader>(reader, payload);
  header.hashes = ReadNested<HashHeader>(reader, payload);
  header.chunk_size = reader.U64();
  header.split_size = reader.U64();
  header.split = ReadNested<SplitHeader>(reader, payload);
  header.data_length = reader.U64();
  if (header.version > MainHeader::kVersionWithoutSignatureFlag) {
    const uint8_t flag = reader.U8();
    if (flag > 1) {
      ThrowMalformed(reader.kind(), "signature flag must be 0 or 1");
    }
    header.signature_flag = flag == 1;
  }
  if (header.chunk_size == 0) {
    ThrowMalformed(reader.kind(), "chunk size is zero");
  }
}

std::array<uint8_t, 5> EncryptedHeaderAad(uint8_t version) {
  const uint32_t magic_be = zf::ToBigEndian32(kEncryptedMainHeaderMagic);
  std::array<uint8_t, 5> aad{};
  std::memcpy(aad.data(), &magic_be, sizeof(magic_be));
  aad[4] = version;
  return aad;
}

EncryptionFlag ReadFlag(ByteReader& reader) {
  const uint8_t flag = reader.U8();
  if (flag > static_cast<uint8_t>(EncryptionFlag::kFull)) {
    ThrowMalformed(reader.kind(), zf::errors::msg::kEncryptionFlagInvalid);
  }
  return static_cast<EncryptionFlag>(flag);
}

}  // namespace

std::vector<uint8_t> MainHeader::Encode(std::span<const uint8_t> content_key) const {
  if ((encryption_flag == EncryptionFlag::kNone) == encryption.has_value()) {
    throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                    "main header encryption flag disagrees with encryption header presence");
  }
  ByteWriter writer;
  if (version == 0 || version > kVersion) {
    throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                    "main header version " + std::to_string(version) + " cannot be encoded");
  }
  if (signature_flag && version == kVersionWithoutSignatureFlag) {
    throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                    "version 1 main header cannot record a signature flag");
  }
  if (encryption_flag != EncryptionFlag::kFull) {
    const size_t frame = writer.BeginFrame(kMainHeaderMagic, version);
    writer.PutU8(static_cast<uint8_t>(encryption_flag));
    if (encryption) {
      encryption->EncodeTo(writer);
    }
    EncodeInnerFields(writer, *this);
    writer.EndFrame(frame);
    return writer.Take();
  }

  ByteWriter inner;
  EncodeInnerFields(inner, *this);
  const auto aad = EncryptedHeaderAad(version);
  auto sealed = crypto::AES_GCM_SIV_Seal(encryption->algorithm, content_key, encryption->nonce, aad,
                                         inner.buffer());
  const size_t frame = writer.BeginFrame(kEncryptedMainHeaderMagic, version);
  writer.PutU8(static_cast<uint8_t>(encryption_flag));
  encryption->EncodeTo(writer);
  writer.PutU64(sealed.size());
  writer.PutBytes(sealed);
  writer.EndFrame(frame);
  return writer.Take();
}

MainHeaderEnvelope ReadMainHeaderEnvelope(std::span<const uint8_t> input) {
  const auto magic = PeekMagic(input);
  const bool encrypted = magic && *magic == kEncryptedMainHeaderMagic;
  const std::string_view kind = encrypted ? kEncryptedMainKind : kMainKind;
  const FrameView frame = encrypted
                              ? OpenFrame(input, kEncryptedMainHeaderMagic, MainHeader::kEncryptedVersion, kind)
                              : OpenFrame(input, kMainHeaderMagic, MainHeader::kVersion, kind);
  ByteReader reader(frame.payload, kind);
  MainHeaderEnvelope envelope;
  envelope.magic = frame.magic;
  envelope.version = frame.version;
  envelope.length = frame.length;
  envelope.encryption_flag = ReadFlag(reader);
  if (encrypted != (envelope.encryption_flag == EncryptionFlag::kFull)) {
    ThrowMalformed(kind, zf::errors::msg::kEncryptionFlagInvalid);
  }
  if (envelope.encryption_flag != EncryptionFlag::kNone) {
    envelope.encryption = ReadNested<EncryptionHeader>(reader, frame.payload);
  }
  envelope.body_offset = kFramePrefixSize + reader.consumed();
  return envelope;
}

Decoded<MainHeader> MainHeader::Decode(std::span<const uint8_t> input, std::span<const uint8_t> content_key) {
  MainHeaderEnvelope envelope = ReadMainHeaderEnvelope(input);
  const bool encrypted = envelope.encryption_flag == EncryptionFlag::kFull;
  const std::string_view kind = encrypted ? kEncryptedMainKind : kMainKind;
  const auto payload =
      input.subspan(envelope.body_offset, static_cast<size_t>(envelope.length) - envelope.body_offset);

  ByteReader reader(payload, kind);
  MainHeader header;
  header.version = envelope.version;
  header.encryption_flag = envelope.encryption_flag;
  header.encryption = std::move(envelope.encryption);

  if (!encrypted) {
    DecodeInnerFields(reader, payload, header);
    ExpectFullyConsumed(reader);
    return {std::move(header), static_cast<size_t>(envelope.length)};
  }

  if (content_key.empty()) {
    throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kPassphraseRequired,
                    std::string(zf::errors::msg::kPassphraseRequired));
  }
  const uint64_t sealed_length = reader.U64();
  if (sealed_length != reader.remaining()) {
    ThrowMalformed(kind, zf::errors::msg::kHeaderTrailingBytes);
  }
  const auto sealed = reader.Bytes(static_cast<size_t>(sealed_length));
  const auto aad = EncryptedHeaderAad(envelope.version);
  std::vector<uint8_t> inner;
  try {
    inner = crypto::AES_GCM_SIV_Open(header.encryption->algorithm, content_key, header.encryption->nonce,
                                     aad, sealed);
  } catch (const zf::AuthenticationFailureError&) {
    zf::Error error(zf::ErrorDomain::Crypto, zf::errors::crypto::kDecryptionFailed,
                    std::string(zf::errors::msg::kHeaderDecryptionFailed));
    error.AddContext(std::string(kEncryptedMainKind));
    throw error;
  }
  ByteReader inner_reader(inner, kind);
  DecodeInnerFields(inner_reader, inner, header);
  ExpectFullyConsumed(inner_reader);
  return {std::move(header), static_cast<size_t>(envelope.length)};
}

}  // namespace zf::format
