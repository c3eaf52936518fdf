#include "zf/storage/segment_writer.h"

#include <string>

#include "zf/error.h"
#include "zf/orchestrator/event_bus.h"

namespace zf::storage {

namespace {

void PublishRollover(uint64_t container_id, const SegmentSummary& closed) {
  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kLifecycle;
  event.severity = orchestrator::EventSeverity::kInfo;
  event.event_id = "segment_closed";
  event.message = "Segment closed";
  event.fields.emplace_back("container_id", std::to_string(container_id), orchestrator::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("split_number", std::to_string(closed.split_number), orchestrator::FieldPrivacy::kPublic,
                            true);
  event.fields.emplace_back("data_length", std::to_string(closed.data_length), orchestrator::FieldPrivacy::kPublic,
                            true);
  event.fields.emplace_back("chunks", std::to_string(closed.chunk_count), orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(event);
}

}  // namespace

SegmentWriter::SegmentWriter(SegmentSinkFactory factory, uint64_t container_id, uint64_t split_size,
                             size_t main_header_size)
    : factory_(std::move(factory)),
      container_id_(container_id),
      split_size_(split_size),
      main_header_size_(main_header_size) {
  if (!factory_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "SegmentWriter requires a sink factory"};
  }
}

SegmentWriter::~SegmentWriter() = default;

uint64_t SegmentWriter::RecordSize(const SealedChunk& chunk) {
  return chunk.header.Encode().size() + chunk.payload.size();
}

SegmentSink& SegmentWriter::Sink() {
  return current_sink_ ? *current_sink_ : *first_sink_;
}

void SegmentWriter::OpenSegment() {
  const uint64_t split_number = closed_.size() + 1;
  auto sink = factory_(split_number);
  if (!sink) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "No sink for segment " + std::to_string(split_number)};
  }
  const size_t reserved = split_number == 1 ? main_header_size_ : format::SplitHeader::kEncodedSize;
  const std::vector<uint8_t> zeros(reserved, 0);
  sink->Append(zeros);
  if (split_number == 1) {
    first_sink_ = std::move(sink);
  } else {
    current_sink_ = std::move(sink);
  }
  current_ = SegmentSummary{split_number, 0, 0};
  open_ = true;
}

void SegmentWriter::CloseCurrentSegment() {
  if (!open_) {
    return;
  }
  if (current_.split_number > 1) {
    format::SplitHeader split{container_id_, current_.split_number, current_.data_length};
    current_sink_->WriteAt(0, split.Encode());
    current_sink_->Close();
    current_sink_.reset();
  }
  closed_.push_back(current_);
  open_ = false;
  PublishRollover(container_id_, closed_.back());
}

void SegmentWriter::Append(const SealedChunk& chunk) {
  if (finished_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "SegmentWriter already finished"};
  }
  const auto header_bytes = chunk.header.Encode();
  const uint64_t record = header_bytes.size() + chunk.payload.size();
  if (!open_) {
    OpenSegment();
  } else if (split_size_ != 0 && current_.data_length > 0 && current_.data_length + record > split_size_) {
    CloseCurrentSegment();
    OpenSegment();
  }
  auto& sink = Sink();
  sink.Append(header_bytes);
  sink.Append(chunk.payload);
  current_.data_length += record;
  ++current_.chunk_count;
}

std::vector<SegmentSummary> SegmentWriter::Finish(const MainHeaderBuilder& build_main_header) {
  if (finished_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "SegmentWriter already finished"};
  }
  if (!open_ && closed_.empty()) {
    OpenSegment();
  }
  CloseCurrentSegment();
  finished_ = true;

  const format::SplitHeader first_split{container_id_, 1, closed_.front().data_length};
  const auto main_header = build_main_header(first_split);
  if (main_header.size() != main_header_size_) {
    throw Error{ErrorDomain::Internal, errors::internal::kInvalidState,
                "Main header size changed from " + std::to_string(main_header_size_) + " to " +
                    std::to_string(main_header.size())};
  }
  first_sink_->WriteAt(0, main_header);
  first_sink_->Close();
  first_sink_.reset();
  return closed_;
}

}  // namespace zf::storage
