#include <cassert>
#include <cstdint>
#include <iostream>
#include <span>
#include <vector>

#include "test_util.h"
#include "zf/common.h"
#include "zf/crypto/provider.h"
#include "zf/format/hash_header.h"
#include "zf/hash/digest.h"

namespace {

using zf::hash::HashAlgorithm;
using zf::test::FromHex;

void TestKnownAnswers() {
  const auto abc = zf::AsBytes("abc");
  assert(zf::hash::Compute(HashAlgorithm::kSha256, abc) ==
             FromHex("ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad") &&
         "SHA-256");
  assert(zf::hash::Compute(HashAlgorithm::kSha3_256, abc) ==
             FromHex("3a985da74fe225b2045c172d6bd390bd855f086e3e9d525b46bfe24511431532") &&
         "SHA3-256");
  assert(zf::hash::Compute(HashAlgorithm::kBlake2b512, abc) ==
             FromHex("ba80a53f981c4d0d6a2797b69f12f6e94c212f14685ac4b74b12bb6fdbffa2d1"
                     "7d87c5392aab792dc252d5de4533cc9518d38aa8dbf1925ab92386edd4009923") &&
         "BLAKE2b-512");
  assert(zf::hash::Compute(HashAlgorithm::kSha512, abc) ==
             FromHex("ddaf35a193617abacc417349ae20413112e6fa4e89a97ea20a9eeee64b55d39a"
                     "2192992a274fc1a836ba3c23a3feebbd454d4423643ce80e2a9ac94fa54ca49f") &&
         "SHA-512");
  assert(zf::hash::Compute(HashAlgorithm::kNone, abc).empty() && "None has no digest");
}

void TestMultiHasherStreaming() {
  const auto data = zf::test::PatternBytes(100'000, 4);
  zf::hash::MultiHasher hasher({HashAlgorithm::kBlake2b512, HashAlgorithm::kSha3_256});
  const std::span<const uint8_t> view(data);
  hasher.Update(view.first(1));
  hasher.Update(view.subspan(1, 50'000));
  hasher.Update(view.subspan(50'001));
  [[maybe_unused]] const auto results = hasher.Finalize();
  assert(results.size() == 2 && "one result per algorithm");
  assert(results[0].algorithm == HashAlgorithm::kBlake2b512 && "input order kept");
  assert(results[0].digest == zf::hash::Compute(HashAlgorithm::kBlake2b512, data) && "streamed == one-shot");
  assert(results[1].digest == zf::hash::Compute(HashAlgorithm::kSha3_256, data) && "streamed == one-shot");
}

void TestRegistry() {
  assert(zf::hash::DigestLength(1) == 64u && zf::hash::DigestLength(2) == 32u && "digest lengths");
  assert(zf::hash::DigestLength(3) == 32u && zf::hash::DigestLength(4) == 64u && "digest lengths");
  assert(zf::hash::DigestLength(0) == 0u && "None is zero-length");
  assert(!zf::hash::DigestLength(99) && "unknown tag has no length");
  assert(zf::hash::ParseHashAlgorithm("sha3-256") == HashAlgorithm::kSha3_256 && "parse by name");
}

void TestUnknownTagPreserved() {
  zf::format::HashHeader header;
  zf::format::HashValue future;
  future.type = 0x7F;
  future.digest = zf::test::PatternBytes(20, 1);
  header.values.push_back(future);
  header.values.push_back(zf::format::HashValue::For(HashAlgorithm::kSha256, zf::hash::Compute(HashAlgorithm::kSha256, {})));
  [[maybe_unused]] const auto decoded = zf::format::HashHeader::Decode(header.Encode()).header;
  assert(decoded.values.size() == 2 && decoded.values[0] == future && "unknown value round-trips untouched");
  assert(decoded.Find(HashAlgorithm::kSha256) != nullptr && "known value still found");
}

void TestPlaceholderSize() {
  const std::vector<HashAlgorithm> algorithms{HashAlgorithm::kBlake2b512, HashAlgorithm::kSha256};
  const auto placeholder = zf::format::HashHeader::Placeholder(algorithms);
  zf::hash::MultiHasher hasher(algorithms);
  hasher.Update(zf::AsBytes("image"));
  [[maybe_unused]] const auto final_header = zf::format::HashHeader::FromResults(hasher.Finalize());
  assert(placeholder.Encode().size() == final_header.Encode().size() && "placeholder reserves the final size");
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();
  TestKnownAnswers();
  TestMultiHasherStreaming();
  TestRegistry();
  TestUnknownTagPreserved();
  TestPlaceholderSize();
  std::cout << "hash test ok\n";
  return 0;
}
