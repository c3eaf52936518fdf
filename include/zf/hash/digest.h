#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "zf/crypto/provider.h"

namespace zf::hash {

// Tag values are part of the Hash Value wire format. The tag space is open;
// decoders keep unknown tags verbatim.
enum class HashAlgorithm : uint8_t {
  kNone = 0,
  kBlake2b512 = 1,
  kSha3_256 = 2,
  kSha256 = 3,
  kSha512 = 4,
};

bool IsKnownHashAlgorithm(uint8_t tag) noexcept;

// Output size in bytes; 0 for kNone, std::nullopt for an unknown tag.
std::optional<size_t> DigestLength(uint8_t tag) noexcept;

const char* HashAlgorithmName(uint8_t tag) noexcept;
std::optional<HashAlgorithm> ParseHashAlgorithm(std::string_view name) noexcept;

// Returns an empty digest for kNone.
std::vector<uint8_t> Compute(HashAlgorithm algorithm, std::span<const uint8_t> data);

struct DigestResult {
  HashAlgorithm algorithm{HashAlgorithm::kNone};
  std::vector<uint8_t> digest;
};

// Feeds every configured algorithm from one pass over the data.
class MultiHasher {
public:
  explicit MultiHasher(std::vector<HashAlgorithm> algorithms);

  void Update(std::span<const uint8_t> data);
  std::vector<DigestResult> Finalize();

private:
  std::vector<HashAlgorithm> algorithms_;
  std::vector<std::unique_ptr<crypto::DigestContext>> contexts_;
  bool finalized_{false};
};

}  // namespace zf::hash
