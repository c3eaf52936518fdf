#include <algorithm>
#include <array>
#include <cassert>
#include <cstdint>
#include <iostream>
#include <memory>
#include <span>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "test_util.h"
#include "zf/crypto/provider.h"
#include "zf/errors.h"
#include "zf/format/codec.h"
#include "zf/format/header_variant.h"
#include "zf/orchestrator/container.h"
#include "zf/storage/segment_io.h"

namespace {

using namespace zf::orchestrator;
using zf::storage::MemorySinkCollection;
using zf::storage::MemorySources;
using zf::test::CaptureErrorCode;

using Segments = std::vector<std::vector<uint8_t>>;

constexpr uint64_t kChunkSize = 1024;

WriterOptions FastOptions() {
  WriterOptions options;
  options.chunk_size = kChunkSize;
  options.pbkdf2_iterations = 1000;
  return options;
}

Segments WriteContainer(const WriterOptions& options, const std::vector<uint8_t>& image,
                        ContainerSummary* summary = nullptr) {
  MemorySinkCollection collection;
  ContainerWriter writer(options, collection.Factory());
  // Uneven write sizes exercise chunk cutting.
  size_t offset = 0;
  size_t step = 1;
  while (offset < image.size()) {
    const size_t take = std::min(step, image.size() - offset);
    writer.Write(std::span<const uint8_t>(image.data() + offset, take));
    offset += take;
    step = step * 3 + 1;
  }
  auto result = writer.Finish();
  if (summary != nullptr) {
    *summary = result;
  }
  return collection.Segments();
}

std::vector<uint8_t> ExtractAll(const ContainerReader& reader, VerificationReport* report = nullptr) {
  std::vector<uint8_t> out;
  auto result = reader.Extract([&](std::span<const uint8_t> bytes) { out.insert(out.end(), bytes.begin(), bytes.end()); });
  if (report != nullptr) {
    *report = result;
  }
  return out;
}

ReaderOptions WithPassphrase(std::string passphrase) {
  ReaderOptions options;
  options.passphrase = std::move(passphrase);
  return options;
}

uint64_t PlainRecordSize(const WriterOptions& options) {
  zf::storage::ChunkCodecSettings settings;
  settings.chunk_size = options.chunk_size;
  settings.compression = options.compression;
  settings.chunk_hashes = options.chunk_hashes;
  zf::storage::ChunkCodec codec(std::move(settings));
  return zf::storage::SegmentWriter::RecordSize(codec.Seal(1, std::vector<uint8_t>(options.chunk_size, 0)));
}

void TestPlainSingleSegment() {
  auto options = FastOptions();
  options.compression = zf::compression::CompressionAlgorithm::kNone;
  const auto image = zf::test::PatternBytes(10 * kChunkSize, 10);
  ContainerSummary summary;
  const auto segments = WriteContainer(options, image, &summary);
  assert(segments.size() == 1 && "one segment");
  assert(summary.chunk_count == 10 && "ten chunks");

  auto reader = ContainerReader::Open(MemorySources(segments), {});
  const auto& header = reader.main_header();
  assert(header.split.split_number == 1 && "split number 1");
  assert(header.encryption_flag == zf::format::EncryptionFlag::kNone && "no encryption");
  assert(header.data_length == image.size() && "data length recorded");
  const auto header_length = header.Encode().size();
  assert(header.split.segment_length == segments[0].size() - header_length && "segment length = chunk records");
  uint64_t records = 0;
  for (const auto& location : reader.index().chunks()) {
    records += location.header.Encode().size() + location.header.stored_size;
  }
  assert(records == header.split.segment_length && "data region holds only chunk headers and payloads");

  VerificationReport report;
  assert(ExtractAll(reader, &report) == image && "plaintext restored exactly");
  assert(report.Clean() && report.chunks_read == 10 && "clean report");
  assert(report.image_hashes.size() == 1 && report.image_hashes[0].verified && report.image_hashes[0].matched &&
         "image digest verified");
  assert(reader.ReadChunk(4) ==
             std::vector<uint8_t>(image.begin() + 3 * kChunkSize, image.begin() + 4 * kChunkSize) &&
         "random access by chunk number");
}

void TestEncryptedPassphrases() {
  auto options = FastOptions();
  options.passphrase = "correct-horse";
  const auto image = zf::test::PatternBytes(5 * kChunkSize + 123, 20);
  const auto segments = WriteContainer(options, image);
  assert(zf::format::PeekMagic(segments[0]) == zf::format::kEncryptedMainHeaderMagic && "metadata encrypted");

  auto reader = ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse"));
  assert(ExtractAll(reader) == image && "right passphrase restores the image");

  for (int attempt = 0; attempt < 2; ++attempt) {
    assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(segments), WithPassphrase("wrong-password")); }) ==
               zf::errors::crypto::kKeyUnwrapFailed &&
           "wrong passphrase fails deterministically at key unwrap");
  }
  assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(segments), {}); }) ==
             zf::errors::crypto::kPassphraseRequired &&
         "missing passphrase");

  [[maybe_unused]] const auto report = VerifyContainer(MemorySources(segments), WithPassphrase("wrong-password"));
  assert(!report.usable && report.failure_code == zf::errors::crypto::kKeyUnwrapFailed && "unusable with reason");
  assert(!report.failure_reason.empty() && "reason text present");
}

void TestSegmentOrder() {
  auto options = FastOptions();
  options.compression = zf::compression::CompressionAlgorithm::kNone;
  options.split_size = 4 * PlainRecordSize(options);
  const auto image = zf::test::PatternBytes(12 * kChunkSize, 30);
  ContainerSummary summary;
  const auto segments = WriteContainer(options, image, &summary);
  assert(segments.size() == 3 && "three segments");
  for ([[maybe_unused]] const auto& segment : summary.segments) {
    assert(segment.chunk_count == 4 && "four chunks per segment");
  }

  const Segments out_of_order{segments[1], segments[0], segments[2]};
  assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(out_of_order), {}); }) ==
             zf::errors::segment::kSegmentMismatch &&
         "order 2,1,3 rejected");
  const Segments tail_swapped{segments[0], segments[2], segments[1]};
  assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(tail_swapped), {}); }) ==
             zf::errors::segment::kSegmentMismatch &&
         "order 1,3,2 rejected");

  auto reader = ContainerReader::Open(MemorySources(segments), {});
  assert(ExtractAll(reader) == image && "order 1,2,3 accepted");
  assert(reader.index().Find(9)->split_number == 3 && "chunk 9 lives in segment 3");

  const Segments missing_last{segments[0], segments[1]};
  auto partial = ContainerReader::Open(MemorySources(missing_last), {});
  VerificationReport report;
  [[maybe_unused]] const auto recovered = ExtractAll(partial, &report);
  assert(report.usable && report.chunk_issues.size() == 4 && "missing chunks reported individually");
  assert(recovered.size() == image.size() && "missing chunks zero-filled");
}

void TestCorruptedChunkIsolated() {
  auto options = FastOptions();
  options.passphrase = "correct-horse";
  const auto image = zf::test::PatternBytes(8 * kChunkSize, 40);
  auto segments = WriteContainer(options, image);
  {
    auto reader = ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse"));
    const auto* location = reader.index().Find(3);
    segments[0][location->payload_offset + 5] ^= 0x10;
  }
  auto reader = ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse"));
  VerificationReport report;
  const auto recovered = ExtractAll(reader, &report);
  assert(report.usable && "container still usable");
  assert(report.chunk_issues.size() == 1 && report.chunk_issues[0].chunk_number == 3 && "only chunk 3 reported");
  assert(report.chunk_issues[0].code == zf::errors::crypto::kDecryptionFailed && "authentication failure");
  assert(report.IntegrityWarnings() == 2 && "chunk issue plus image digest mismatch");
  assert(std::equal(recovered.begin(), recovered.begin() + 2 * kChunkSize, image.begin()) && "chunks 1-2 intact");
  assert(std::equal(recovered.begin() + 3 * kChunkSize, recovered.end(), image.begin() + 3 * kChunkSize) &&
         "chunks 4-8 intact");

  ReaderOptions strict = WithPassphrase("correct-horse");
  strict.fail_fast = true;
  auto strict_reader = ContainerReader::Open(MemorySources(segments), strict);
  assert(CaptureErrorCode([&] { (void)strict_reader.Verify(); }) == zf::errors::crypto::kDecryptionFailed &&
         "fail-fast propagates");
}

void TestPlainMetadataMode() {
  auto options = FastOptions();
  options.passphrase = "correct-horse";
  options.encrypt_header = false;
  options.description.case_number = "CASE-9";
  options.description.examiner = "J. Ortiz";
  const auto image = zf::test::PatternBytes(3 * kChunkSize, 50);
  const auto segments = WriteContainer(options, image);
  assert(zf::format::PeekMagic(segments[0]) == zf::format::kMainHeaderMagic && "plain framing");

  zf::storage::MemorySegmentSource first(segments[0]);
  [[maybe_unused]] const auto header = zf::format::MainHeader::Decode(ReadMainHeaderBytes(first)).header;
  assert(header.encryption_flag == zf::format::EncryptionFlag::kChunksOnly && "flag 1");
  assert(header.description.case_number == "CASE-9" && "description readable without a passphrase");

  assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(segments), {}); }) ==
             zf::errors::crypto::kPassphraseRequired &&
         "chunks still need the passphrase");
  auto reader = ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse"));
  assert(ExtractAll(reader) == image && "flag 1 round trip");
}

void TestRewrap() {
  auto options = FastOptions();
  options.passphrase = "correct-horse";
  const auto image = zf::test::PatternBytes(4 * kChunkSize + 7, 60);
  auto segments = WriteContainer(options, image);

  zf::storage::MemorySegmentSource first(segments[0]);
  const auto replacement = RewrapKey(first, "correct-horse", "battery-staple");
  assert(CaptureErrorCode([&] { (void)RewrapKey(first, "wrong-password", "x"); }) ==
             zf::errors::crypto::kKeyUnwrapFailed &&
         "rewrap needs the current passphrase");
  std::copy(replacement.begin(), replacement.end(), segments[0].begin());

  auto reader = ContainerReader::Open(MemorySources(segments), WithPassphrase("battery-staple"));
  assert(ExtractAll(reader) == image && "new passphrase opens the same data");
  assert(CaptureErrorCode([&] { (void)ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse")); }) ==
             zf::errors::crypto::kKeyUnwrapFailed &&
         "old passphrase no longer works");
}

void TestParallelAndEdgeLengths() {
  auto options = FastOptions();
  options.worker_threads = 4;
  options.image_hashes = {zf::hash::HashAlgorithm::kSha256, zf::hash::HashAlgorithm::kBlake2b512};
  options.split_size = 6 * kChunkSize;
  const auto image = zf::test::PatternBytes(40 * kChunkSize + 1, 70);
  auto reader = ContainerReader::Open(MemorySources(WriteContainer(options, image)), {});
  VerificationReport report;
  assert(ExtractAll(reader, &report) == image && "parallel sealing keeps chunk order");
  assert(report.Clean() && report.image_hashes.size() == 2 && "both image digests verified");
  assert(reader.ExpectedChunkCount() == 41 && "partial last chunk counted");

  const std::vector<uint8_t> empty;
  auto empty_reader = ContainerReader::Open(MemorySources(WriteContainer(FastOptions(), empty)), {});
  VerificationReport empty_report;
  assert(ExtractAll(empty_reader, &empty_report).empty() && "empty image");
  assert(empty_report.Clean() && empty_report.chunks_read == 0 && "empty image verifies");
}

std::array<uint8_t, zf::crypto::kEd25519KeySize> TestSeed(uint32_t seed) {
  std::array<uint8_t, zf::crypto::kEd25519KeySize> key{};
  const auto bytes = zf::test::PatternBytes(key.size(), seed);
  std::copy(bytes.begin(), bytes.end(), key.begin());
  return key;
}

void TestSignedContainer() {
  auto options = FastOptions();
  options.passphrase = "correct-horse";
  options.signing_key = TestSeed(80);
  const auto image = zf::test::PatternBytes(6 * kChunkSize + 9, 80);
  const auto segments = WriteContainer(options, image);
  const auto public_key = zf::crypto::GetCryptoProvider().Ed25519PublicKey(TestSeed(80));

  ReaderOptions verifying = WithPassphrase("correct-horse");
  verifying.verify_key = public_key;
  auto reader = ContainerReader::Open(MemorySources(segments), verifying);
  assert(reader.main_header().signature_flag && "main header records signed chunks");
  VerificationReport report;
  assert(ExtractAll(reader, &report) == image && "signed container restores the image");
  assert(report.Clean() && report.signatures_verified && "every signature verified");
  for ([[maybe_unused]] const auto& location : reader.index().chunks()) {
    assert(location.header.signature && "each chunk carries a signature");
  }

  auto unchecked = ContainerReader::Open(MemorySources(segments), WithPassphrase("correct-horse"));
  [[maybe_unused]] const auto unchecked_report = unchecked.Verify();
  assert(unchecked_report.Clean() && !unchecked_report.signatures_verified && "no key, signatures not checked");

  ReaderOptions wrong = WithPassphrase("correct-horse");
  wrong.verify_key = zf::crypto::GetCryptoProvider().Ed25519PublicKey(TestSeed(81));
  auto wrong_reader = ContainerReader::Open(MemorySources(segments), wrong);
  [[maybe_unused]] const auto wrong_report = wrong_reader.Verify();
  assert(wrong_report.usable && wrong_report.chunk_issues.size() == 7 && "every chunk fails under another key");
  assert(std::all_of(wrong_report.chunk_issues.begin(), wrong_report.chunk_issues.end(),
                     [](const ChunkIssue& issue) { return issue.code == zf::errors::integrity::kSignatureInvalid; }) &&
         "signature failures carry their own code");

  auto unsigned_options = FastOptions();
  const auto unsigned_segments = WriteContainer(unsigned_options, image);
  ReaderOptions demanding;
  demanding.verify_key = public_key;
  [[maybe_unused]] const auto unsigned_report = VerifyContainer(MemorySources(unsigned_segments), demanding);
  assert(unsigned_report.usable && unsigned_report.chunk_issues.size() == 7 &&
         "unsigned chunks are reported when a key is supplied");
}

void TestUnreadableRanges() {
  auto options = FastOptions();
  options.worker_threads = 2;
  const auto head = zf::test::PatternBytes(kChunkSize + kChunkSize / 2, 90);
  const auto tail = zf::test::PatternBytes(kChunkSize, 91);
  const uint64_t gap = 2 * kChunkSize;

  MemorySinkCollection collection;
  ContainerWriter writer(options, collection.Factory());
  writer.Write(head);
  writer.WriteUnreadable(gap);
  writer.Write(tail);
  const auto summary = writer.Finish();
  assert(summary.data_length == head.size() + gap + tail.size() && "unreadable bytes count toward the image");
  assert(summary.unreadable_chunks == 3 && "chunks 2, 3 and 4 touch the unreadable range");

  std::vector<uint8_t> expected = head;
  expected.resize(expected.size() + gap, 0);
  expected.insert(expected.end(), tail.begin(), tail.end());

  auto reader = ContainerReader::Open(MemorySources(collection.Segments()), {});
  VerificationReport report;
  assert(ExtractAll(reader, &report) == expected && "unreadable range reads back as zeros");
  assert((report.unreadable_chunks == std::vector<uint64_t>{2, 3, 4}) && "flagged chunks reported");
  assert(report.Clean() && "read errors recorded at acquisition are not integrity warnings");
  assert(reader.index().Find(2)->header.HasFlag(zf::format::chunk_flags::kReadError) && "flag on disk");
  assert(!reader.index().Find(1)->header.HasFlag(zf::format::chunk_flags::kReadError) && "readable chunk unflagged");
  assert(!reader.index().Find(5)->header.HasFlag(zf::format::chunk_flags::kReadError) && "tail chunk unflagged");
}

void TestLz4Container() {
  auto options = FastOptions();
  options.compression = zf::compression::CompressionAlgorithm::kLz4;
  options.compression_level = 0;
  options.split_size = 3 * kChunkSize;
  auto image = zf::test::PatternBytes(5 * kChunkSize, 100);
  image.resize(image.size() + 5 * kChunkSize, 0);
  const auto segments = WriteContainer(options, image);
  auto reader = ContainerReader::Open(MemorySources(segments), {});
  assert(reader.main_header().compression.algorithm == zf::compression::CompressionAlgorithm::kLz4 &&
         "lz4 recorded in the compression header");
  VerificationReport report;
  assert(ExtractAll(reader, &report) == image && report.Clean() && "lz4 container round trip");
  assert(!reader.index().Find(1)->header.HasFlag(zf::format::chunk_flags::kCompressed) && "noise stored raw");
  assert(reader.index().Find(10)->header.HasFlag(zf::format::chunk_flags::kCompressed) && "zeros compressed");
}

void TestHeaderDispatchOnContainerBytes() {
  auto options = FastOptions();
  options.compression = zf::compression::CompressionAlgorithm::kNone;
  options.split_size = 2 * PlainRecordSize(options);
  const auto image = zf::test::PatternBytes(5 * kChunkSize, 110);
  const auto segments = WriteContainer(options, image);
  assert(segments.size() == 3 && "three segments");

  zf::storage::MemorySegmentSource first(segments[0]);
  const auto main_bytes = ReadMainHeaderBytes(first);
  [[maybe_unused]] const auto main = zf::format::DecodeAnyHeader(main_bytes);
  assert(std::holds_alternative<zf::format::MainHeader>(main.header) && main.consumed == main_bytes.size() &&
         "segment 1 starts with the main header");

  [[maybe_unused]] const auto chunk = zf::format::DecodeAnyHeader(std::span<const uint8_t>(segments[0]).subspan(main.consumed));
  assert(std::holds_alternative<zf::format::ChunkHeader>(chunk.header) &&
         std::get<zf::format::ChunkHeader>(chunk.header).chunk_number == 1 && "chunk 1 follows the main header");

  [[maybe_unused]] const auto split = zf::format::DecodeAnyHeader(segments[1]);
  assert(std::holds_alternative<zf::format::SplitHeader>(split.header) &&
         std::get<zf::format::SplitHeader>(split.header).split_number == 2 && "later segments start with a split header");
}

void TestWriterValidation() {
  auto options = FastOptions();
  options.chunk_size = 0;
  MemorySinkCollection collection;
  assert(CaptureErrorCode([&] { ContainerWriter writer(options, collection.Factory()); }) ==
             zf::errors::config::kInvalidConfiguration &&
         "chunk size 0 rejected before any byte is written");
  assert(collection.Segments().empty() && "no segment produced");
}

}  // namespace

int main() {
  zf::crypto::EnsureCryptoProviderInitialized();
  TestPlainSingleSegment();
  TestEncryptedPassphrases();
  TestSegmentOrder();
  TestCorruptedChunkIsolated();
  TestPlainMetadataMode();
  TestRewrap();
  TestParallelAndEdgeLengths();
  TestWriterValidation();
  TestSignedContainer();
  TestUnreadableRanges();
  TestLz4Container();
  TestHeaderDispatchOnContainerBytes();
  std::cout << "container scenarios test ok\n";
  return 0;
}
