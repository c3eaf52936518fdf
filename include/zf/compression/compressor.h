#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

namespace zf::compression {

// Tag values are part of the Compression Header wire format.
enum class CompressionAlgorithm : uint8_t {
  kNone = 0,
  kZstd = 1,
  kLz4 = 2,  // LZ4 frame format
};

bool IsKnownCompressionAlgorithm(uint8_t tag) noexcept;
const char* CompressionAlgorithmName(CompressionAlgorithm algorithm) noexcept;
std::optional<CompressionAlgorithm> ParseCompressionAlgorithm(std::string_view name) noexcept;

// Highest level accepted for |algorithm|; 0 for kNone.
int MaxCompressionLevel(CompressionAlgorithm algorithm) noexcept;

// Throws zf::Error(kCompressionFailed) when the codec reports an error.
std::vector<uint8_t> Compress(CompressionAlgorithm algorithm, std::span<const uint8_t> input, int level);

// Throws zf::Error(kDecompressionFailed) for a corrupt or truncated stream,
// or when the frame declares more than |max_output| bytes.
std::vector<uint8_t> Decompress(CompressionAlgorithm algorithm, std::span<const uint8_t> input,
                                size_t max_output);

}  // namespace zf::compression
