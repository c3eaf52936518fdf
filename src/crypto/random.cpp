#include "zf/crypto/random.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <climits>
#include <cstring>
#include <string>

#if defined(__linux__)
#include <sys/random.h>
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#endif

#include <openssl/err.h>
#include <openssl/rand.h>

#include "zf/error.h"

namespace zf::crypto {
namespace {

[[noreturn]] void ThrowRandomFailure(const std::string& source, int native) {
  throw zf::Error(zf::ErrorDomain::Crypto, zf::errors::crypto::kProviderFailure,
                  "System random source failed: " + source, native);
}

// Kernels without getrandom(2) still have OpenSSL's seeded DRBG.
void FillFromOpenSSL(std::span<uint8_t> out) {
  while (!out.empty()) {
    const size_t step = std::min<size_t>(out.size(), INT_MAX);
    if (RAND_bytes(out.data(), static_cast<int>(step)) != 1) {
      ThrowRandomFailure("RAND_bytes", static_cast<int>(ERR_get_error()));
    }
    out = out.subspan(step);
  }
}

}  // namespace

void SystemRandomBytes(std::span<uint8_t> out) {
#if defined(__linux__)
  while (!out.empty()) {
    const ssize_t got = ::getrandom(out.data(), out.size(), 0);
    if (got > 0) {
      out = out.subspan(static_cast<size_t>(got));
    } else if (errno == ENOSYS) {
      FillFromOpenSSL(out);
      return;
    } else if (errno != EINTR) {
      ThrowRandomFailure("getrandom", errno);
    }
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  if (!out.empty()) {
    arc4random_buf(out.data(), out.size());
  }
#else
  FillFromOpenSSL(out);
#endif
}

uint64_t RandomU64() {
  std::array<uint8_t, sizeof(uint64_t)> bytes{};
  SystemRandomBytes(bytes);
  uint64_t value = 0;
  std::memcpy(&value, bytes.data(), bytes.size());
  return value;
}

}  // namespace zf::crypto
