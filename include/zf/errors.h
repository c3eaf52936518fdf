#pragma once

#include <string_view>

namespace zf::errors::msg {
// Centralized message catalog.
inline constexpr std::string_view kHeaderTruncated{"Header truncated"};
inline constexpr std::string_view kHeaderMagicMismatch{"Header magic mismatch"};
inline constexpr std::string_view kHeaderLengthInvalid{"Header length inconsistent with buffer"};
inline constexpr std::string_view kHeaderTrailingBytes{"Header length does not match decoded payload"};
inline constexpr std::string_view kHeaderVersionZero{"Header version 0 is not valid"};
inline constexpr std::string_view kHeaderVersionUnsupported{"Header version newer than supported"};
inline constexpr std::string_view kUnknownCompressionAlgorithm{"Unknown compression algorithm"};
inline constexpr std::string_view kUnknownEncryptionAlgorithm{"Unknown encryption algorithm"};
inline constexpr std::string_view kUnknownKdfScheme{"Unknown key derivation scheme"};
inline constexpr std::string_view kUnknownPbeScheme{"Unknown password-based encryption scheme"};
inline constexpr std::string_view kUnknownDescriptionTag{"Unknown description field tag"};
inline constexpr std::string_view kDuplicateDescriptionTag{"Description field tag occurs more than once"};
inline constexpr std::string_view kAcquisitionDateLength{"Acquisition date field must be 8 bytes"};
inline constexpr std::string_view kDigestLengthMismatch{"Digest length does not match hash algorithm"};
inline constexpr std::string_view kEncryptionFlagInvalid{"Main header encryption flag invalid"};
inline constexpr std::string_view kChunkSizeZero{"Chunk stored size must be greater than zero"};
inline constexpr std::string_view kKeyUnwrapFailed{"Unable to unwrap content-encryption key (wrong passphrase or corrupted key)"};
inline constexpr std::string_view kPassphraseRequired{"Container is encrypted and no passphrase was supplied"};
inline constexpr std::string_view kHeaderDecryptionFailed{"Encrypted main header failed authentication"};
inline constexpr std::string_view kChunkDecryptionFailed{"Chunk payload failed authentication"};
inline constexpr std::string_view kDecompressionFailed{"Compressed stream is corrupt"};
inline constexpr std::string_view kChunkDigestMismatch{"Chunk digest mismatch"};
inline constexpr std::string_view kChunkCrcMismatch{"Chunk CRC32 mismatch"};
inline constexpr std::string_view kChunkSignatureInvalid{"Chunk signature does not verify"};
inline constexpr std::string_view kChunkSignatureMissing{"Chunk carries no signature"};
inline constexpr std::string_view kUnknownChunkFlags{"Chunk header sets undefined flag bits"};
inline constexpr std::string_view kChunkReadError{"Chunk was unreadable at acquisition and holds zeros"};
inline constexpr std::string_view kEmptyDescriptionValue{"Description field value is empty"};
inline constexpr std::string_view kImageDigestMismatch{"Image digest mismatch"};
inline constexpr std::string_view kImageLengthMismatch{"Recovered image length differs from declared data length"};
inline constexpr std::string_view kSegmentIdentifierMismatch{"Segment belongs to a different container"};
inline constexpr std::string_view kSegmentOutOfOrder{"Segment presented out of split-number order"};
inline constexpr std::string_view kSegmentLengthMismatch{"Segment length differs from split header declaration"};
inline constexpr std::string_view kSegmentMissingMainHeader{"First segment does not start with a main header"};
inline constexpr std::string_view kChunkNumberGap{"Chunk numbers are not contiguous"};
inline constexpr std::string_view kChunkOverrunsSegment{"Chunk payload extends beyond segment data region"};
inline constexpr std::string_view kNoSegments{"No segments supplied"};
}  // namespace zf::errors::msg
