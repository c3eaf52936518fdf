#pragma once

#include <span>
#include <string_view>
#include <variant>

#include "zf/format/codec.h"
#include "zf/format/compression_header.h"
#include "zf/format/description_header.h"
#include "zf/format/encryption_header.h"
#include "zf/format/hash_header.h"
#include "zf/format/main_header.h"
#include "zf/format/segment_headers.h"

namespace zf::format {

using AnyHeader = std::variant<MainHeader, EncryptionHeader, PbeHeader, CompressionHeader,
                               DescriptionHeader, HashHeader, HashValue, SplitHeader, ChunkHeader>;

// Decodes whichever header kind the leading magic names. Encrypted main
// headers need |content_key|; the KDF parameter object is only meaningful
// inside a PBE header and is rejected here.
Decoded<AnyHeader> DecodeAnyHeader(std::span<const uint8_t> input,
                                   std::span<const uint8_t> content_key = {});

std::string_view HeaderKindName(uint32_t magic) noexcept;

}  // namespace zf::format
