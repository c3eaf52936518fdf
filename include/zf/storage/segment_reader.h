#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "zf/error.h"
#include "zf/format/segment_headers.h"
#include "zf/storage/segment_io.h"

namespace zf::storage {

struct SegmentInfo {
  format::SplitHeader split;
  uint64_t data_offset{0};  // first byte of the data region within the segment
};

struct ChunkLocation {
  format::ChunkHeader header;
  uint64_t split_number{0};
  size_t segment_index{0};
  uint64_t payload_offset{0};
};

// A structural problem confined to one segment's data region.
struct IndexIssue {
  uint64_t split_number{0};
  std::optional<uint64_t> chunk_number;
  Error error;
};

// Validated segment table plus the offset of every chunk.
class ChunkIndex {
public:
  // |first_split| and |first_data_offset| come from the decoded main header of
  // sources[0]. Segment identity, order or length problems throw
  // kSegmentMismatch. A malformed chunk header stops the scan of that segment
  // and is recorded as an issue, or thrown when |fail_fast| is set.
  static ChunkIndex Build(const std::vector<std::unique_ptr<SegmentSource>>& sources,
                          const format::SplitHeader& first_split, uint64_t first_data_offset,
                          bool fail_fast);

  [[nodiscard]] const std::vector<SegmentInfo>& segments() const noexcept { return segments_; }
  [[nodiscard]] const std::vector<ChunkLocation>& chunks() const noexcept { return chunks_; }
  [[nodiscard]] const std::vector<IndexIssue>& issues() const noexcept { return issues_; }

  [[nodiscard]] const ChunkLocation* Find(uint64_t chunk_number) const noexcept;

private:
  void ScanSegment(const SegmentSource& source, size_t segment_index, bool fail_fast);

  std::vector<SegmentInfo> segments_;
  std::vector<ChunkLocation> chunks_;
  std::vector<IndexIssue> issues_;
  uint64_t next_chunk_number_{1};
  bool sorted_{true};
};

}  // namespace zf::storage
