#include <chrono>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "zf/crypto/provider.h"
#include "zf/orchestrator/container.h"
#include "zf/storage/segment_io.h"

namespace {

constexpr size_t kTestSize = 64 * 1024 * 1024;
constexpr size_t kWriteBlock = 1024 * 1024;

double MegabytesPerSecond(size_t bytes, std::chrono::steady_clock::duration elapsed) {
  const double seconds = std::chrono::duration<double>(elapsed).count();
  return seconds > 0 ? (static_cast<double>(bytes) / (1024.0 * 1024.0)) / seconds : 0.0;
}

void RunCase(const std::string& label, zf::orchestrator::WriterOptions options) {
  std::vector<uint8_t> block(kWriteBlock);
  zf::storage::MemorySinkCollection collection;

  auto start = std::chrono::steady_clock::now();
  {
    zf::orchestrator::ContainerWriter writer(options, collection.Factory());
    for (size_t offset = 0; offset < kTestSize; offset += kWriteBlock) {
      for (size_t i = 0; i < block.size(); ++i) {
        // Half-compressible content.
        block[i] = (i & 0x100) ? static_cast<uint8_t>((offset + i) * 2654435761u >> 24) : 0;
      }
      writer.Write(block);
    }
    (void)writer.Finish();
  }
  const auto write_elapsed = std::chrono::steady_clock::now() - start;

  zf::orchestrator::ReaderOptions read_options;
  read_options.passphrase = options.passphrase;
  start = std::chrono::steady_clock::now();
  auto reader = zf::orchestrator::ContainerReader::Open(zf::storage::MemorySources(collection.Segments()),
                                                        read_options);
  const auto report = reader.Verify();
  const auto read_elapsed = std::chrono::steady_clock::now() - start;

  std::cout << label << ": write " << MegabytesPerSecond(kTestSize, write_elapsed) << " MiB/s, verify "
            << MegabytesPerSecond(kTestSize, read_elapsed) << " MiB/s"
            << (report.Clean() ? "" : " (integrity warnings!)") << '\n';
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();

  zf::orchestrator::WriterOptions plain;
  RunCase("zstd", plain);

  zf::orchestrator::WriterOptions encrypted;
  encrypted.passphrase = "benchmark";
  encrypted.pbkdf2_iterations = 1000;
  RunCase("zstd+aes256-gcm-siv", encrypted);

  encrypted.worker_threads = 4;
  RunCase("zstd+aes256-gcm-siv x4", encrypted);
  return 0;
}
