#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "test_util.h"
#include "zf/crypto/provider.h"
#include "zf/errors.h"
#include "zf/orchestrator/container.h"
#include "zf/storage/segment_io.h"

namespace {

using namespace zf::orchestrator;
using zf::test::CaptureErrorCode;

class TempDir {
public:
  TempDir() {
    auto base = std::filesystem::temp_directory_path();
    auto name = std::string{"zf_segment_files_"} +
                std::to_string(static_cast<unsigned long long>(
                    std::chrono::steady_clock::now().time_since_epoch().count()));
    path_ = base / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_{};
};

std::vector<std::filesystem::path> SegmentPaths(const std::filesystem::path& base, size_t count) {
  std::vector<std::filesystem::path> paths;
  for (size_t i = 1; i <= count; ++i) {
    paths.push_back(zf::storage::SegmentFileName(base, i));
  }
  return paths;
}

void TestNaming() {
  assert(zf::storage::SegmentFileName("image", 1).string() == "image.z01" && "two-digit suffix");
  assert(zf::storage::SegmentFileName("image", 123).string() == "image.z123" && "suffix grows past 99");
}

void TestFileRoundTrip() {
  TempDir dir;
  const auto base = dir.path() / "evidence";
  WriterOptions options;
  options.chunk_size = 4096;
  options.split_size = 16 * 1024;
  options.passphrase = "correct-horse";
  options.pbkdf2_iterations = 1000;
  options.description.evidence_number = "EV-1";
  const auto image = zf::test::PatternBytes(100 * 1024 + 5, 3);

  ContainerWriter writer(options, zf::storage::FileSinkFactory(base));
  writer.Write(image);
  const auto summary = writer.Finish();
  assert(summary.segments.size() > 1 && "split across files");
  for ([[maybe_unused]] const auto& path : SegmentPaths(base, summary.segments.size())) {
    assert(std::filesystem::exists(path) && "segment file written");
  }

  ReaderOptions read_options;
  read_options.passphrase = "correct-horse";
  auto reader = ContainerReader::Open(zf::storage::OpenSegmentFiles(SegmentPaths(base, summary.segments.size())),
                                      read_options);
  std::vector<uint8_t> restored;
  const auto report = reader.Extract(
      [&](std::span<const uint8_t> bytes) { restored.insert(restored.end(), bytes.begin(), bytes.end()); });
  assert(report.Clean() && restored == image && "files restore the image");
  assert(reader.main_header().description.evidence_number == "EV-1" && "description survives");
  assert(reader.container_id() == summary.container_id && "same container");
}

void TestAbortedWrite() {
  TempDir dir;
  const auto base = dir.path() / "aborted";
  {
    WriterOptions options;
    options.chunk_size = 1024;
    ContainerWriter writer(options, zf::storage::FileSinkFactory(base));
    writer.Write(zf::test::PatternBytes(10 * 1024, 4));
  }
  const auto report = VerifyContainer(zf::storage::OpenSegmentFiles(SegmentPaths(base, 1)), {});
  assert(!report.usable && report.failure_code == zf::errors::format::kMalformedHeader &&
         "unfinished container has a zero header region");
}

void TestMissingFile() {
  TempDir dir;
  assert(CaptureErrorCode([&] { (void)zf::storage::OpenSegmentFiles({dir.path() / "absent.z01"}); }) ==
             zf::errors::io::kOpenFailed &&
         "missing segment file");

  const auto path = dir.path() / "short.bin";
  std::ofstream(path, std::ios::binary) << "abc";
  zf::storage::FileSegmentSource source(path);
  assert(source.Size() == 3 && "size from the file system");
  assert(CaptureErrorCode([&] { (void)source.Read(2, 2); }) == zf::errors::io::kReadFailed && "read past the end");
}

void TestErrorContext() {
  zf::Error error{zf::ErrorDomain::Integrity, zf::errors::integrity::kIntegrityViolation, "Chunk digest mismatch"};
  error.AddContext("chunk 4");
  error.AddContext("segment 2");
  assert(error.Describe() == "Chunk digest mismatch [segment 2] [chunk 4]" && "outermost frame first");
  assert(zf::IsFrameworkErrorCode(zf::ErrorDomain::Integrity, error.code) && "code in the domain range");
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();
  TestNaming();
  TestFileRoundTrip();
  TestAbortedWrite();
  TestMissingFile();
  TestErrorContext();
  std::cout << "segment files test ok\n";
  return 0;
}
