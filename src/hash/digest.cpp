#include "zf/hash/digest.h"

#include <utility>

#include "zf/error.h"

namespace zf::hash {

namespace {

std::optional<crypto::DigestAlgorithm> ProviderAlgorithm(HashAlgorithm algorithm) noexcept {
  switch (algorithm) {
  case HashAlgorithm::kNone:
    return std::nullopt;
  case HashAlgorithm::kBlake2b512:
    return crypto::DigestAlgorithm::kBlake2b512;
  case HashAlgorithm::kSha3_256:
    return crypto::DigestAlgorithm::kSha3_256;
  case HashAlgorithm::kSha256:
    return crypto::DigestAlgorithm::kSha256;
  case HashAlgorithm::kSha512:
    return crypto::DigestAlgorithm::kSha512;
  }
  return std::nullopt;
}

}  // namespace

bool IsKnownHashAlgorithm(uint8_t tag) noexcept {
  return tag <= static_cast<uint8_t>(HashAlgorithm::kSha512);
}

std::optional<size_t> DigestLength(uint8_t tag) noexcept {
  if (!IsKnownHashAlgorithm(tag)) {
    return std::nullopt;
  }
  auto provider_alg = ProviderAlgorithm(static_cast<HashAlgorithm>(tag));
  return provider_alg ? crypto::DigestSize(*provider_alg) : 0;
}

const char* HashAlgorithmName(uint8_t tag) noexcept {
  switch (tag) {
  case static_cast<uint8_t>(HashAlgorithm::kNone):
    return "none";
  case static_cast<uint8_t>(HashAlgorithm::kBlake2b512):
    return "blake2b-512";
  case static_cast<uint8_t>(HashAlgorithm::kSha3_256):
    return "sha3-256";
  case static_cast<uint8_t>(HashAlgorithm::kSha256):
    return "sha256";
  case static_cast<uint8_t>(HashAlgorithm::kSha512):
    return "sha512";
  default:
    return "unknown";
  }
}

std::optional<HashAlgorithm> ParseHashAlgorithm(std::string_view name) noexcept {
  for (uint8_t tag = 0; tag <= static_cast<uint8_t>(HashAlgorithm::kSha512); ++tag) {
    if (name == HashAlgorithmName(tag)) {
      return static_cast<HashAlgorithm>(tag);
    }
  }
  return std::nullopt;
}

std::vector<uint8_t> Compute(HashAlgorithm algorithm, std::span<const uint8_t> data) {
  auto provider_alg = ProviderAlgorithm(algorithm);
  if (!provider_alg) {
    return {};
  }
  auto context = crypto::GetCryptoProviderShared()->NewDigest(*provider_alg);
  context->Update(data);
  return context->Finalize();
}

MultiHasher::MultiHasher(std::vector<HashAlgorithm> algorithms) : algorithms_(std::move(algorithms)) {
  auto provider = crypto::GetCryptoProviderShared();
  contexts_.reserve(algorithms_.size());
  for (auto algorithm : algorithms_) {
    auto provider_alg = ProviderAlgorithm(algorithm);
    contexts_.push_back(provider_alg ? provider->NewDigest(*provider_alg) : nullptr);
  }
}

void MultiHasher::Update(std::span<const uint8_t> data) {
  if (finalized_) {
    throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                    "MultiHasher updated after Finalize");
  }
  for (auto& context : contexts_) {
    if (context) {
      context->Update(data);
    }
  }
}

std::vector<DigestResult> MultiHasher::Finalize() {
  if (finalized_) {
    throw zf::Error(zf::ErrorDomain::Internal, zf::errors::internal::kInvalidState,
                    "MultiHasher finalized twice");
  }
  finalized_ = true;
  std::vector<DigestResult> results;
  results.reserve(algorithms_.size());
  for (size_t i = 0; i < algorithms_.size(); ++i) {
    DigestResult result;
    result.algorithm = algorithms_[i];
    if (contexts_[i]) {
      result.digest = contexts_[i]->Finalize();
    }
    results.push_back(std::move(result));
  }
  return results;
}

}  // namespace zf::hash
