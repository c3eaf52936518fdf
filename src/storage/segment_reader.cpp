#include "zf/storage/segment_reader.h"

#include <algorithm>
#include <string>

#include "zf/errors.h"
#include "zf/format/codec.h"

namespace zf::storage {

namespace {

// Covers a chunk header with several digests and a signature.
constexpr size_t kChunkHeaderReadAhead = 4096;

[[noreturn]] void ThrowMismatch(std::string_view reason, uint64_t split_number, std::string detail = {}) {
  std::string message(reason);
  if (!detail.empty()) {
    message += ": " + detail;
  }
  Error error{ErrorDomain::Segment, errors::segment::kSegmentMismatch, std::move(message)};
  error.AddContext("segment " + std::to_string(split_number));
  throw error;
}

SegmentInfo ReadFollowingSegment(const SegmentSource& source, uint64_t container_id, uint64_t expected_split) {
  const auto head = source.Read(0, static_cast<size_t>(std::min<uint64_t>(source.Size(), format::SplitHeader::kEncodedSize)));
  const auto magic = format::PeekMagic(head);
  if (magic && (*magic == format::kMainHeaderMagic || *magic == format::kEncryptedMainHeaderMagic)) {
    ThrowMismatch(errors::msg::kSegmentOutOfOrder, expected_split, "found the first segment");
  }
  format::SplitHeader split;
  try {
    split = format::SplitHeader::Decode(head).header;
  } catch (Error& error) {
    error.AddContext("segment " + std::to_string(expected_split));
    throw;
  }
  if (split.container_id != container_id) {
    ThrowMismatch(errors::msg::kSegmentIdentifierMismatch, expected_split);
  }
  if (split.split_number != expected_split) {
    ThrowMismatch(errors::msg::kSegmentOutOfOrder, expected_split,
                  "split header declares " + std::to_string(split.split_number));
  }
  return SegmentInfo{split, format::SplitHeader::kEncodedSize};
}

void CheckLength(const SegmentSource& source, const SegmentInfo& info) {
  const uint64_t actual = source.Size() - std::min(source.Size(), info.data_offset);
  if (source.Size() < info.data_offset || actual != info.split.segment_length) {
    ThrowMismatch(errors::msg::kSegmentLengthMismatch, info.split.split_number,
                  "declared " + std::to_string(info.split.segment_length) + ", present " + std::to_string(actual));
  }
}

}  // namespace

ChunkIndex ChunkIndex::Build(const std::vector<std::unique_ptr<SegmentSource>>& sources,
                             const format::SplitHeader& first_split, uint64_t first_data_offset,
                             bool fail_fast) {
  if (sources.empty()) {
    throw Error{ErrorDomain::Segment, errors::segment::kSegmentMismatch, std::string(errors::msg::kNoSegments)};
  }
  if (first_split.split_number != 1) {
    ThrowMismatch(errors::msg::kSegmentOutOfOrder, 1,
                  "main header declares split " + std::to_string(first_split.split_number));
  }
  ChunkIndex index;
  for (size_t i = 0; i < sources.size(); ++i) {
    const uint64_t expected_split = i + 1;
    SegmentInfo info = i == 0 ? SegmentInfo{first_split, first_data_offset}
                              : ReadFollowingSegment(*sources[i], first_split.container_id, expected_split);
    CheckLength(*sources[i], info);
    index.segments_.push_back(info);
    index.ScanSegment(*sources[i], i, fail_fast);
  }
  return index;
}

void ChunkIndex::ScanSegment(const SegmentSource& source, size_t segment_index, bool fail_fast) {
  const SegmentInfo& info = segments_[segment_index];
  const uint64_t end = info.data_offset + info.split.segment_length;
  uint64_t offset = info.data_offset;
  while (offset < end) {
    try {
      auto head = source.Read(offset, static_cast<size_t>(std::min<uint64_t>(end - offset, kChunkHeaderReadAhead)));
      if (auto declared = format::PeekFrameLength(head); declared && *declared > head.size() &&
                                                          *declared <= end - offset) {
        head = source.Read(offset, static_cast<size_t>(*declared));
      }
      auto decoded = format::ChunkHeader::Decode(head);
      const uint64_t payload_offset = offset + decoded.consumed;
      if (decoded.header.stored_size > end - payload_offset) {
        format::ThrowMalformed("chunk header", errors::msg::kChunkOverrunsSegment);
      }
      if (decoded.header.chunk_number != next_chunk_number_) {
        const uint64_t found = decoded.header.chunk_number;
        // Resynchronise so one gap is reported once.
        if (found < next_chunk_number_) {
          sorted_ = false;
        }
        next_chunk_number_ = found + 1;
        offset = payload_offset + decoded.header.stored_size;
        Error gap{ErrorDomain::Segment, errors::segment::kSegmentMismatch,
                  std::string(errors::msg::kChunkNumberGap) + ": found " + std::to_string(found)};
        gap.AddContext("segment " + std::to_string(info.split.split_number));
        if (fail_fast) {
          throw gap;
        }
        issues_.push_back(IndexIssue{info.split.split_number, found, gap});
        chunks_.push_back(ChunkLocation{std::move(decoded.header), info.split.split_number, segment_index,
                                        payload_offset});
        continue;
      }
      offset = payload_offset + decoded.header.stored_size;
      ++next_chunk_number_;
      chunks_.push_back(ChunkLocation{std::move(decoded.header), info.split.split_number, segment_index,
                                      payload_offset});
    } catch (Error& error) {
      if (error.domain == ErrorDomain::Segment) {
        throw;
      }
      error.AddContext("segment " + std::to_string(info.split.split_number) + " offset " + std::to_string(offset));
      if (fail_fast) {
        throw;
      }
      issues_.push_back(IndexIssue{info.split.split_number, std::nullopt, error});
      return;
    }
  }
}

const ChunkLocation* ChunkIndex::Find(uint64_t chunk_number) const noexcept {
  if (!sorted_) {
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [chunk_number](const ChunkLocation& loc) { return loc.header.chunk_number == chunk_number; });
    return it == chunks_.end() ? nullptr : &*it;
  }
  auto it = std::lower_bound(chunks_.begin(), chunks_.end(), chunk_number,
                             [](const ChunkLocation& loc, uint64_t n) { return loc.header.chunk_number < n; });
  if (it == chunks_.end() || it->header.chunk_number != chunk_number) {
    return nullptr;
  }
  return &*it;
}

}  // namespace zf::storage
