#include <cassert>
#include <cstdlib>
#include <iostream>

#include "test_util.h"
#include "zf/errors.h"
#include "zf/orchestrator/config.h"

namespace {

using namespace zf::orchestrator;
using zf::test::CaptureErrorCode;

constexpr int kInvalid = zf::errors::config::kInvalidConfiguration;

void ClearEnvironment() {
  for (const char* name : {"ZF_CHUNK_SIZE", "ZF_SPLIT_SIZE", "ZF_COMPRESSION", "ZF_COMPRESSION_LEVEL",
                           "ZF_PBKDF2_ITERATIONS", "ZF_WORKER_THREADS"}) {
    ::unsetenv(name);
  }
}

void TestDefaults() {
  const WriterOptions options;
  assert(options.chunk_size == 32 * 1024 && "32 KiB chunks");
  assert(options.split_size == 0 && "unsplit");
  assert(options.compression == zf::compression::CompressionAlgorithm::kZstd && options.compression_level == 3 &&
         "zstd level 3");
  assert(options.image_hashes.size() == 1 && options.image_hashes[0] == zf::hash::HashAlgorithm::kBlake2b512 &&
         "BLAKE2b image hash");
  assert(options.chunk_hashes.size() == 1 && options.chunk_hashes[0] == zf::hash::HashAlgorithm::kSha3_256 &&
         "SHA3-256 chunk hash");
  assert(options.aead == zf::crypto::AeadAlgorithm::kAes256GcmSiv && "AES256-GCM-SIV");
  assert(options.pbe_scheme == zf::crypto::PbeScheme::kAes256Cbc && "AES256-CBC");
  assert(options.pbkdf2_iterations == 50'000 && "PBKDF2 iterations");
  assert(options.encrypt_header && options.worker_threads == 1 && "header encryption, one worker");
  ValidateWriterOptions(options);
}

void TestValidation() {
  auto check = [](auto mutate) {
    WriterOptions options;
    mutate(options);
    return CaptureErrorCode([&] { ValidateWriterOptions(options); });
  };
  assert(check([](WriterOptions& o) { o.chunk_size = 0; }) == kInvalid && "zero chunk size");
  assert(check([](WriterOptions& o) { o.chunk_size = kMaxChunkSize + 1; }) == kInvalid && "oversized chunk");
  assert(check([](WriterOptions& o) { o.compression_level = 99; }) == kInvalid && "zstd level range");
  assert(check([](WriterOptions& o) {
           o.compression = zf::compression::CompressionAlgorithm::kNone;
           o.compression_level = 99;
         }) == -1 &&
         "level ignored without compression");
  assert(check([](WriterOptions& o) { o.passphrase = ""; }) == kInvalid && "empty passphrase");
  assert(check([](WriterOptions& o) {
           o.passphrase = "x";
           o.pbkdf2_iterations = 0;
         }) == kInvalid &&
         "zero iterations");
  assert(check([](WriterOptions& o) {
           o.passphrase = "x";
           o.kdf = zf::crypto::KdfScheme::kScrypt;
           o.scrypt.r = 0;
         }) == kInvalid &&
         "scrypt cost");
  assert(check([](WriterOptions& o) {
           o.passphrase = "x";
           o.kdf = zf::crypto::KdfScheme::kScrypt;
           o.scrypt.log_n = zf::crypto::kMaxScryptLogN + 1;
         }) == kInvalid &&
         "scrypt N above 2^30");
  assert(check([](WriterOptions& o) {
           o.compression = zf::compression::CompressionAlgorithm::kLz4;
           o.compression_level = 0;
         }) == -1 &&
         "lz4 accepts its default level 0");
  assert(check([](WriterOptions& o) {
           o.compression = zf::compression::CompressionAlgorithm::kLz4;
           o.compression_level = 13;
         }) == kInvalid &&
         "lz4 level range");
  assert(check([](WriterOptions& o) { o.worker_threads = 0; }) == kInvalid && "no workers");
  assert(check([](WriterOptions& o) {
           o.image_hashes = {zf::hash::HashAlgorithm::kSha256, zf::hash::HashAlgorithm::kSha256};
         }) == kInvalid &&
         "duplicate hash algorithm");
}

void TestEnvironmentOverrides() {
  ClearEnvironment();
  ::setenv("ZF_CHUNK_SIZE", "65536", 1);
  ::setenv("ZF_SPLIT_SIZE", "1048576", 1);
  ::setenv("ZF_COMPRESSION", "none", 1);
  ::setenv("ZF_PBKDF2_ITERATIONS", "1000", 1);
  ::setenv("ZF_WORKER_THREADS", "4", 1);
  [[maybe_unused]] const auto options = ApplyEnvironmentOverrides({});
  assert(options.chunk_size == 65536 && options.split_size == 1048576 && "sizes overridden");
  assert(options.compression == zf::compression::CompressionAlgorithm::kNone && "compression overridden");
  assert(options.pbkdf2_iterations == 1000 && options.worker_threads == 4 && "counts overridden");

  ::setenv("ZF_COMPRESSION", "lz4", 1);
  assert(ApplyEnvironmentOverrides({}).compression == zf::compression::CompressionAlgorithm::kLz4 &&
         "lz4 selectable from the environment");
  ::setenv("ZF_COMPRESSION", "brotli", 1);
  assert(CaptureErrorCode([] { (void)ApplyEnvironmentOverrides({}); }) == kInvalid && "unknown codec name");
  ::setenv("ZF_COMPRESSION", "zstd", 1);
  ::setenv("ZF_CHUNK_SIZE", "12k", 1);
  assert(CaptureErrorCode([] { (void)ApplyEnvironmentOverrides({}); }) == kInvalid && "non-numeric value");
  ::setenv("ZF_CHUNK_SIZE", "4096", 1);
  ::setenv("ZF_PBKDF2_ITERATIONS", "70000", 1);
  assert(CaptureErrorCode([] { (void)ApplyEnvironmentOverrides({}); }) == kInvalid && "iterations exceed u16");
  ClearEnvironment();
}

}  // namespace

int main() {
  TestDefaults();
  TestValidation();
  TestEnvironmentOverrides();
  std::cout << "config test ok\n";
  return 0;
}
