#include "zf/crypto/pbkdf2.h"

#include <algorithm>
#include <cstddef>

#include "zf/common.h"
#include "zf/crypto/provider.h"
#include "zf/security/zeroizer.h"

namespace zf::crypto {
namespace {

using Tag = std::array<uint8_t, kHmacSha256Size>;

constexpr uint32_t kProgressStride = 10'000;

// F(P, S, c, i) = U1 ^ U2 ^ ... ^ Uc with U1 = PRF(P, S || INT(i)).
Tag DeriveBlock(CryptoProvider& provider, std::span<const uint8_t> password,
                std::span<const uint8_t> salted_index, uint32_t iterations,
                const PBKDF2ProgressCallback& progress) {
  Tag chain = provider.HMACSHA256(password, salted_index);
  Tag folded = chain;
  security::Zeroizer::ScopeWiper<uint8_t> chain_guard{std::span<uint8_t>(chain)};
  for (uint32_t round = 2; round <= iterations; ++round) {
    chain = provider.HMACSHA256(password, chain);
    std::transform(folded.begin(), folded.end(), chain.begin(), folded.begin(),
                   [](uint8_t acc, uint8_t next) { return static_cast<uint8_t>(acc ^ next); });
    if (progress && round % kProgressStride == 0) {
      progress(round, iterations);
    }
  }
  return folded;
}

}  // namespace

std::array<uint8_t, kHmacSha256Size> HmacSha256(std::span<const uint8_t> key,
                                                std::span<const uint8_t> message) {
  return GetCryptoProviderShared()->HMACSHA256(key, message);
}

std::vector<uint8_t> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                        std::span<const uint8_t> salt,
                                        uint32_t iterations,
                                        size_t output_size,
                                        PBKDF2ProgressCallback progress) {
  iterations = std::max<uint32_t>(iterations, 1);
  auto provider = GetCryptoProviderShared();

  std::vector<uint8_t> derived;
  derived.reserve(output_size);
  std::vector<uint8_t> salted_index(salt.begin(), salt.end());
  salted_index.resize(salt.size() + sizeof(uint32_t));
  security::Zeroizer::ScopeWiper<uint8_t> salted_guard{std::span<uint8_t>(salted_index)};

  for (uint32_t index = 1; derived.size() < output_size; ++index) {
    const uint32_t be_index = zf::ToBigEndian32(index);
    const auto index_bytes = zf::AsBytesConst(be_index);
    std::copy(index_bytes.begin(), index_bytes.end(), salted_index.end() - static_cast<std::ptrdiff_t>(sizeof(uint32_t)));

    Tag block = DeriveBlock(*provider, password, salted_index, iterations, progress);
    security::Zeroizer::ScopeWiper<uint8_t> block_guard{std::span<uint8_t>(block)};
    const size_t take = std::min(block.size(), output_size - derived.size());
    derived.insert(derived.end(), block.begin(), block.begin() + static_cast<std::ptrdiff_t>(take));
  }

  if (progress) {
    progress(iterations, iterations);
  }
  return derived;
}

}  // namespace zf::crypto
