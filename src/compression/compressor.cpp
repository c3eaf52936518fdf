#include "zf/compression/compressor.h"

#include <memory>
#include <string>

#include <lz4frame.h>
#include <zstd.h>

#include "zf/error.h"
#include "zf/errors.h"

namespace zf::compression {

namespace {

[[noreturn]] void ThrowDecompressionFailed(std::string detail) {
  throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kDecompressionFailed,
                  std::string(zf::errors::msg::kDecompressionFailed) + ": " + detail);
}

std::vector<uint8_t> ZstdCompress(std::span<const uint8_t> input, int level) {
  const size_t bound = ZSTD_compressBound(input.size());
  std::vector<uint8_t> compressed(bound);
  const size_t compressed_size =
      ZSTD_compress(compressed.data(), compressed.size(), input.data(), input.size(), level);
  if (ZSTD_isError(compressed_size)) {
    throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kCompressionFailed,
                    std::string("zstd compression failed: ") + ZSTD_getErrorName(compressed_size));
  }
  compressed.resize(compressed_size);
  return compressed;
}

std::vector<uint8_t> ZstdDecompress(std::span<const uint8_t> input, size_t max_output) {
  const unsigned long long content_size = ZSTD_getFrameContentSize(input.data(), input.size());
  if (content_size == ZSTD_CONTENTSIZE_ERROR) {
    ThrowDecompressionFailed("not a zstd frame");
  }
  if (content_size == ZSTD_CONTENTSIZE_UNKNOWN) {
    ThrowDecompressionFailed("frame does not declare its content size");
  }
  if (content_size > max_output) {
    ThrowDecompressionFailed("frame declares " + std::to_string(content_size) + " bytes, limit " +
                             std::to_string(max_output));
  }
  std::vector<uint8_t> output(static_cast<size_t>(content_size));
  const size_t result = ZSTD_decompress(output.data(), output.size(), input.data(), input.size());
  if (ZSTD_isError(result)) {
    ThrowDecompressionFailed(ZSTD_getErrorName(result));
  }
  if (result != output.size()) {
    ThrowDecompressionFailed("frame content size mismatch");
  }
  return output;
}

std::vector<uint8_t> Lz4Compress(std::span<const uint8_t> input, int level) {
  LZ4F_preferences_t preferences{};
  preferences.frameInfo.contentSize = input.size();
  preferences.frameInfo.contentChecksumFlag = LZ4F_noContentChecksum;
  preferences.compressionLevel = level;
  std::vector<uint8_t> compressed(LZ4F_compressFrameBound(input.size(), &preferences));
  const size_t compressed_size =
      LZ4F_compressFrame(compressed.data(), compressed.size(), input.data(), input.size(), &preferences);
  if (LZ4F_isError(compressed_size)) {
    throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kCompressionFailed,
                    std::string("lz4 compression failed: ") + LZ4F_getErrorName(compressed_size));
  }
  compressed.resize(compressed_size);
  return compressed;
}

struct Lz4ContextDeleter {
  void operator()(LZ4F_dctx* ctx) const noexcept { LZ4F_freeDecompressionContext(ctx); }
};
using Lz4DecompressionContext = std::unique_ptr<LZ4F_dctx, Lz4ContextDeleter>;

// Frames may omit their content size, so output is bounded by |max_output|
// rather than by the frame descriptor.
std::vector<uint8_t> Lz4Decompress(std::span<const uint8_t> input, size_t max_output) {
  LZ4F_dctx* raw = nullptr;
  const size_t created = LZ4F_createDecompressionContext(&raw, LZ4F_VERSION);
  if (LZ4F_isError(created)) {
    throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kDecompressionFailed,
                    std::string("lz4 context allocation failed: ") + LZ4F_getErrorName(created));
  }
  Lz4DecompressionContext ctx(raw);

  std::vector<uint8_t> output(max_output);
  size_t produced = 0;
  size_t consumed = 0;
  size_t hint = 1;
  while (consumed < input.size() && hint != 0) {
    size_t dst_size = output.size() - produced;
    size_t src_size = input.size() - consumed;
    hint = LZ4F_decompress(ctx.get(), output.data() + produced, &dst_size, input.data() + consumed, &src_size,
                           nullptr);
    if (LZ4F_isError(hint)) {
      ThrowDecompressionFailed(LZ4F_getErrorName(hint));
    }
    if (dst_size == 0 && src_size == 0) {
      ThrowDecompressionFailed("frame exceeds limit of " + std::to_string(max_output) + " bytes");
    }
    produced += dst_size;
    consumed += src_size;
  }
  if (hint != 0) {
    ThrowDecompressionFailed("truncated lz4 frame");
  }
  if (consumed != input.size()) {
    ThrowDecompressionFailed("trailing bytes after lz4 frame");
  }
  output.resize(produced);
  return output;
}

}  // namespace

bool IsKnownCompressionAlgorithm(uint8_t tag) noexcept {
  return tag == static_cast<uint8_t>(CompressionAlgorithm::kNone) ||
         tag == static_cast<uint8_t>(CompressionAlgorithm::kZstd) ||
         tag == static_cast<uint8_t>(CompressionAlgorithm::kLz4);
}

const char* CompressionAlgorithmName(CompressionAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case CompressionAlgorithm::kNone:
    return "none";
  case CompressionAlgorithm::kZstd:
    return "zstd";
  case CompressionAlgorithm::kLz4:
    return "lz4";
  }
  return "unknown";
}

std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view name) noexcept {
  if (name == "none") {
    return CompressionAlgorithm::kNone;
  }
  if (name == "zstd") {
    return CompressionAlgorithm::kZstd;
  }
  if (name == "lz4") {
    return CompressionAlgorithm::kLz4;
  }
  return std::nullopt;
}

int MaxCompressionLevel(CompressionAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case CompressionAlgorithm::kZstd:
    return ZSTD_maxCLevel();
  case CompressionAlgorithm::kLz4:
    return LZ4F_compressionLevel_max();
  case CompressionAlgorithm::kNone:
    break;
  }
  return 0;
}

std::vector<uint8_t> Compress(CompressionAlgorithm algorithm, std::span<const uint8_t> input, int level) {
  switch (algorithm) {
  case CompressionAlgorithm::kNone:
    return std::vector<uint8_t>(input.begin(), input.end());
  case CompressionAlgorithm::kZstd:
    return ZstdCompress(input, level);
  case CompressionAlgorithm::kLz4:
    return Lz4Compress(input, level);
  }
  throw zf::Error(zf::ErrorDomain::Codec, zf::errors::codec::kCompressionFailed,
                  std::string(zf::errors::msg::kUnknownCompressionAlgorithm));
}

std::vector<uint8_t> Decompress(CompressionAlgorithm algorithm, std::span<const uint8_t> input,
                                size_t max_output) {
  switch (algorithm) {
  case CompressionAlgorithm::kNone:
    if (input.size() > max_output) {
      ThrowDecompressionFailed("stored chunk exceeds chunk size");
    }
    return std::vector<uint8_t>(input.begin(), input.end());
  case CompressionAlgorithm::kZstd:
    return ZstdDecompress(input, max_output);
  case CompressionAlgorithm::kLz4:
    return Lz4Decompress(input, max_output);
  }
  ThrowDecompressionFailed(std::string(zf::errors::msg::kUnknownCompressionAlgorithm));
}

}  // namespace zf::compression
