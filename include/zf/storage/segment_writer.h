#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "zf/format/segment_headers.h"
#include "zf/storage/chunk_codec.h"
#include "zf/storage/segment_io.h"

namespace zf::storage {

struct SegmentSummary {
  uint64_t split_number{0};
  uint64_t data_length{0};
  uint64_t chunk_count{0};
};

// Places sealed chunks into segments. Segment 1 starts with a reserved region
// for the main header, later segments with a reserved split header; both are
// filled in when the segment closes, so an interrupted write leaves zeros.
class SegmentWriter {
public:
  // Builds the final main header given split header 1. Must return exactly
  // |main_header_size| bytes.
  using MainHeaderBuilder = std::function<std::vector<uint8_t>(const format::SplitHeader& first_split)>;

  SegmentWriter(SegmentSinkFactory factory, uint64_t container_id, uint64_t split_size,
                size_t main_header_size);
  ~SegmentWriter();

  SegmentWriter(const SegmentWriter&) = delete;
  SegmentWriter& operator=(const SegmentWriter&) = delete;

  void Append(const SealedChunk& chunk);

  // Closes the open segment and writes the main header into segment 1.
  std::vector<SegmentSummary> Finish(const MainHeaderBuilder& build_main_header);

  // Bytes a chunk occupies in a data region.
  static uint64_t RecordSize(const SealedChunk& chunk);

private:
  SegmentSink& Sink();
  void OpenSegment();
  void CloseCurrentSegment();

  SegmentSinkFactory factory_;
  uint64_t container_id_{0};
  uint64_t split_size_{0};
  size_t main_header_size_{0};

  std::unique_ptr<SegmentSink> first_sink_;
  std::unique_ptr<SegmentSink> current_sink_;  // null while segment 1 is current
  SegmentSummary current_{};
  std::vector<SegmentSummary> closed_;
  bool open_{false};
  bool finished_{false};
};

}  // namespace zf::storage
