#include "zf/format/encryption_header.h"

#include <algorithm>
#include <variant>

#include "zf/errors.h"

namespace zf::format {

namespace {

constexpr std::string_view kKdfKind{"kdf parameters"};
constexpr std::string_view kPbeKind{"pbe header"};
constexpr std::string_view kEncryptionKind{"encryption header"};

template <size_t N>
void ReadInto(ByteReader& reader, std::array<uint8_t, N>& out) {
  const auto bytes = reader.Bytes(N);
  std::copy(bytes.begin(), bytes.end(), out.begin());
}

}  // namespace

void EncodeKdfParameters(ByteWriter& writer, const crypto::KdfParameters& params) {
  const size_t frame = writer.BeginFrame(kKdfParametersMagic, std::nullopt);
  if (const auto* pbkdf2 = std::get_if<crypto::Pbkdf2Parameters>(&params)) {
    writer.PutU16(pbkdf2->iterations);
    writer.PutBytes(pbkdf2->salt);
  } else {
    const auto& scrypt = std::get<crypto::ScryptParameters>(params);
    writer.PutU8(scrypt.log_n);
    writer.PutU32(scrypt.r);
    writer.PutU32(scrypt.p);
    writer.PutBytes(scrypt.salt);
  }
  writer.EndFrame(frame);
}

Decoded<crypto::KdfParameters> DecodeKdfParameters(std::span<const uint8_t> input, crypto::KdfScheme scheme) {
  const FrameView frame = OpenUnversionedFrame(input, kKdfParametersMagic, kKdfKind);
  ByteReader reader(frame.payload, kKdfKind);
  crypto::KdfParameters params;
  if (scheme == crypto::KdfScheme::kPbkdf2Sha256) {
    crypto::Pbkdf2Parameters pbkdf2;
    pbkdf2.iterations = reader.U16();
    ReadInto(reader, pbkdf2.salt);
    if (pbkdf2.iterations == 0) {
      ThrowMalformed(kKdfKind, "PBKDF2 iteration count is zero");
    }
    params = pbkdf2;
  } else {
    crypto::ScryptParameters scrypt;
    scrypt.log_n = reader.U8();
    scrypt.r = reader.U32();
    scrypt.p = reader.U32();
    ReadInto(reader, scrypt.salt);
    if (scrypt.log_n == 0 || scrypt.log_n > crypto::kMaxScryptLogN || scrypt.r == 0 || scrypt.p == 0) {
      ThrowMalformed(kKdfKind, "scrypt cost parameters out of range");
    }
    params = scrypt;
  }
  ExpectFullyConsumed(reader);
  return {std::move(params), static_cast<size_t>(frame.length)};
}

void PbeHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kPbeHeaderMagic, kVersion);
  writer.PutU8(static_cast<uint8_t>(crypto::SchemeOf(kdf)));
  writer.PutU8(static_cast<uint8_t>(scheme));
  EncodeKdfParameters(writer, kdf);
  writer.PutBytes(iv);
  writer.EndFrame(frame);
}

Decoded<PbeHeader> PbeHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kPbeHeaderMagic, kVersion, kPbeKind);
  ByteReader reader(frame.payload, kPbeKind);
  PbeHeader header;
  const uint8_t kdf_flag = reader.U8();
  if (!crypto::IsKnownKdfScheme(kdf_flag)) {
    ThrowMalformed(kPbeKind, zf::errors::msg::kUnknownKdfScheme);
  }
  const uint8_t scheme_flag = reader.U8();
  if (!crypto::IsKnownPbeScheme(scheme_flag)) {
    ThrowMalformed(kPbeKind, zf::errors::msg::kUnknownPbeScheme);
  }
  header.scheme = static_cast<crypto::PbeScheme>(scheme_flag);
  const size_t kdf_offset = reader.consumed();
  auto kdf = DecodeKdfParameters(frame.payload.subspan(kdf_offset), static_cast<crypto::KdfScheme>(kdf_flag));
  header.kdf = std::move(kdf.header);
  reader.Bytes(kdf.consumed);
  ReadInto(reader, header.iv);
  ExpectFullyConsumed(reader);
  return {std::move(header), static_cast<size_t>(frame.length)};
}

void EncryptionHeader::EncodeTo(ByteWriter& writer) const {
  const size_t frame = writer.BeginFrame(kEncryptionHeaderMagic, kVersion);
  pbe.EncodeTo(writer);
  writer.PutU8(static_cast<uint8_t>(algorithm));
  writer.PutU32(static_cast<uint32_t>(wrapped_key.size()));
  writer.PutBytes(wrapped_key);
  writer.PutBytes(nonce);
  writer.EndFrame(frame);
}

Decoded<EncryptionHeader> EncryptionHeader::Decode(std::span<const uint8_t> input) {
  const FrameView frame = OpenFrame(input, kEncryptionHeaderMagic, kVersion, kEncryptionKind);
  ByteReader reader(frame.payload, kEncryptionKind);
  EncryptionHeader header;
  auto pbe = PbeHeader::Decode(frame.payload);
  header.pbe = std::move(pbe.header);
  reader.Bytes(pbe.consumed);
  const uint8_t algorithm = reader.U8();
  if (!crypto::IsKnownAeadAlgorithm(algorithm)) {
    ThrowMalformed(kEncryptionKind, zf::errors::msg::kUnknownEncryptionAlgorithm);
  }
  header.algorithm = static_cast<crypto::AeadAlgorithm>(algorithm);
  const uint32_t wrapped_length = reader.U32();
  const auto wrapped = reader.Bytes(wrapped_length);
  header.wrapped_key.assign(wrapped.begin(), wrapped.end());
  ReadInto(reader, header.nonce);
  ExpectFullyConsumed(reader);
  return {std::move(header), static_cast<size_t>(frame.length)};
}

}  // namespace zf::format
