#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "zf/error.h"
#include "zf/format/main_header.h"
#include "zf/hash/digest.h"
#include "zf/orchestrator/config.h"
#include "zf/storage/chunk_codec.h"
#include "zf/storage/segment_io.h"
#include "zf/storage/segment_reader.h"
#include "zf/storage/segment_writer.h"

namespace zf::orchestrator {

struct ContainerSummary {
  uint64_t container_id{0};
  uint64_t data_length{0};
  uint64_t chunk_count{0};
  uint64_t unreadable_chunks{0};
  format::EncryptionFlag encryption_flag{format::EncryptionFlag::kNone};
  std::vector<storage::SegmentSummary> segments;
  format::HashHeader image_hashes;
};

// Streams an image into a new container. Bytes are cut into chunks of
// options.chunk_size; chunks are sealed on worker threads in batches and
// appended in chunk-number order.
class ContainerWriter {
public:
  ContainerWriter(WriterOptions options, storage::SegmentSinkFactory sinks);
  ~ContainerWriter();

  ContainerWriter(const ContainerWriter&) = delete;
  ContainerWriter& operator=(const ContainerWriter&) = delete;

  void Write(std::span<const uint8_t> data);
  // Records |length| source bytes that could not be read. They are stored as
  // zeros and every chunk they touch carries the read-error flag.
  void WriteUnreadable(uint64_t length);
  ContainerSummary Finish();

  [[nodiscard]] uint64_t container_id() const noexcept { return container_id_; }

private:
  struct PendingChunk {
    std::vector<uint8_t> plaintext;
    bool read_error{false};
  };

  void Append(std::span<const uint8_t> data, bool unreadable);
  void QueueChunk(PendingChunk chunk);
  void SealPendingBatch();

  WriterOptions options_;
  uint64_t container_id_{0};
  std::vector<uint8_t> content_key_;
  format::MainHeader main_header_;
  std::unique_ptr<storage::ChunkCodec> codec_;
  std::unique_ptr<storage::SegmentWriter> segments_;
  hash::MultiHasher image_hasher_;

  PendingChunk partial_;
  std::vector<PendingChunk> batch_;
  size_t batch_limit_{1};
  uint64_t next_chunk_number_{1};
  uint64_t data_length_{0};
  uint64_t unreadable_chunks_{0};
  bool finished_{false};
};

struct ChunkIssue {
  uint64_t chunk_number{0};  // 0 when the issue is not tied to one chunk
  uint64_t split_number{0};
  ErrorDomain domain{ErrorDomain::Internal};
  int code{0};
  std::string message;
};

struct ImageHashCheck {
  uint8_t type{0};
  bool verified{false};  // false for None and unknown tags
  bool matched{false};
};

struct VerificationReport {
  bool usable{false};
  std::optional<int> failure_code;
  std::string failure_reason;

  std::vector<ChunkIssue> chunk_issues;
  std::vector<ImageHashCheck> image_hashes;
  // Chunks flagged unreadable at acquisition. Their zeros are the faithful
  // record, so they are not integrity warnings.
  std::vector<uint64_t> unreadable_chunks;
  bool signatures_verified{false};  // a verify key was supplied
  uint64_t chunks_read{0};
  uint64_t bytes_recovered{0};
  uint64_t declared_length{0};

  [[nodiscard]] size_t IntegrityWarnings() const noexcept;
  [[nodiscard]] bool Clean() const noexcept { return usable && IntegrityWarnings() == 0; }
};

using PlaintextSink = std::function<void(std::span<const uint8_t>)>;

class ContainerReader {
public:
  // Validates the main header, unwraps the content key and indexes every
  // segment. Sources must be in split-number order. Throws zf::Error.
  static ContainerReader Open(std::vector<std::unique_ptr<storage::SegmentSource>> sources,
                              ReaderOptions options);

  [[nodiscard]] const format::MainHeader& main_header() const noexcept { return main_header_; }
  [[nodiscard]] uint64_t container_id() const noexcept { return main_header_.split.container_id; }
  [[nodiscard]] const storage::ChunkIndex& index() const noexcept { return index_; }
  [[nodiscard]] uint64_t ExpectedChunkCount() const noexcept;

  // Random access through the chunk index.
  std::vector<uint8_t> ReadChunk(uint64_t chunk_number) const;

  // Recovers the image in chunk order. A chunk that cannot be recovered is
  // replaced by zeros of its expected length and reported, unless fail_fast
  // is set, in which case the error propagates.
  VerificationReport Extract(const PlaintextSink& sink) const;
  VerificationReport Verify() const;

private:
  ContainerReader() = default;

  std::vector<std::unique_ptr<storage::SegmentSource>> sources_;
  ReaderOptions options_;
  format::MainHeader main_header_;
  uint64_t main_header_length_{0};
  storage::ChunkIndex index_;
  std::unique_ptr<storage::ChunkCodec> codec_;
};

// Never throws for container problems; they become report.usable == false.
VerificationReport VerifyContainer(std::vector<std::unique_ptr<storage::SegmentSource>> sources,
                                   const ReaderOptions& options);

// Re-wraps the content key of an encrypted container under |new_passphrase|
// with fresh salt and IV. Returns the replacement main header bytes, which
// have the same length as the current ones and go at offset 0 of segment 1.
std::vector<uint8_t> RewrapKey(const storage::SegmentSource& first_segment, std::string_view old_passphrase,
                               std::string_view new_passphrase);

// Reads the complete main header region of the first segment. Throws
// kSegmentMismatch when the source is a later segment.
std::vector<uint8_t> ReadMainHeaderBytes(const storage::SegmentSource& first_segment);

}  // namespace zf::orchestrator
