#include "zf/orchestrator/config.h"

#include <charconv>
#include <cstdlib>
#include <limits>
#include <string_view>

#include "zf/error.h"

namespace zf::orchestrator {

namespace {

[[noreturn]] void ThrowInvalid(const std::string& message) {
  throw Error{ErrorDomain::Config, errors::config::kInvalidConfiguration, message};
}

std::optional<uint64_t> ReadUnsignedEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  const std::string_view text(raw);
  uint64_t value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc() || ptr != text.data() + text.size()) {
    ThrowInvalid(std::string(name) + " is not an unsigned integer: " + std::string(text));
  }
  return value;
}

template <class T>
T Narrow(const char* name, uint64_t value) {
  if (value > static_cast<uint64_t>(std::numeric_limits<T>::max())) {
    ThrowInvalid(std::string(name) + " is out of range");
  }
  return static_cast<T>(value);
}

}  // namespace

void ValidateWriterOptions(const WriterOptions& options) {
  if (options.chunk_size == 0 || options.chunk_size > kMaxChunkSize) {
    ThrowInvalid("chunk size must be between 1 and " + std::to_string(kMaxChunkSize));
  }
  const int max_level = compression::MaxCompressionLevel(options.compression);
  if (options.compression == compression::CompressionAlgorithm::kZstd &&
      (options.compression_level < 1 || options.compression_level > max_level)) {
    ThrowInvalid("zstd level must be between 1 and " + std::to_string(max_level));
  }
  if (options.compression == compression::CompressionAlgorithm::kLz4 &&
      (options.compression_level < 0 || options.compression_level > max_level)) {
    ThrowInvalid("lz4 level must be between 0 and " + std::to_string(max_level));
  }
  for (const auto* set : {&options.image_hashes, &options.chunk_hashes}) {
    for (size_t i = 0; i < set->size(); ++i) {
      for (size_t j = i + 1; j < set->size(); ++j) {
        if ((*set)[i] == (*set)[j]) {
          ThrowInvalid(std::string("hash algorithm listed twice: ") +
                       hash::HashAlgorithmName(static_cast<uint8_t>((*set)[i])));
        }
      }
    }
  }
  if (options.passphrase) {
    if (options.passphrase->empty()) {
      ThrowInvalid("passphrase must not be empty");
    }
    if (options.kdf == crypto::KdfScheme::kPbkdf2Sha256 && options.pbkdf2_iterations == 0) {
      ThrowInvalid("PBKDF2 iteration count must be positive");
    }
    if (options.kdf == crypto::KdfScheme::kScrypt &&
        (options.scrypt.log_n == 0 || options.scrypt.log_n > crypto::kMaxScryptLogN || options.scrypt.r == 0 ||
         options.scrypt.p == 0)) {
      ThrowInvalid("scrypt cost parameters out of range");
    }
  }
  if (options.worker_threads == 0 || options.worker_threads > kMaxWorkerThreads) {
    ThrowInvalid("worker thread count must be between 1 and " + std::to_string(kMaxWorkerThreads));
  }
}

WriterOptions ApplyEnvironmentOverrides(WriterOptions options) {
  if (auto value = ReadUnsignedEnv("ZF_CHUNK_SIZE")) {
    options.chunk_size = *value;
  }
  if (auto value = ReadUnsignedEnv("ZF_SPLIT_SIZE")) {
    options.split_size = *value;
  }
  if (const char* raw = std::getenv("ZF_COMPRESSION"); raw != nullptr && *raw != '\0') {
    auto parsed = compression::ParseCompressionAlgorithm(raw);
    if (!parsed) {
      ThrowInvalid(std::string("ZF_COMPRESSION must be none, zstd or lz4, got ") + raw);
    }
    options.compression = *parsed;
  }
  if (auto value = ReadUnsignedEnv("ZF_COMPRESSION_LEVEL")) {
    options.compression_level = Narrow<int>("ZF_COMPRESSION_LEVEL", *value);
  }
  if (auto value = ReadUnsignedEnv("ZF_PBKDF2_ITERATIONS")) {
    options.pbkdf2_iterations = Narrow<uint16_t>("ZF_PBKDF2_ITERATIONS", *value);
  }
  if (auto value = ReadUnsignedEnv("ZF_WORKER_THREADS")) {
    options.worker_threads = Narrow<unsigned>("ZF_WORKER_THREADS", *value);
  }
  return options;
}

}  // namespace zf::orchestrator
