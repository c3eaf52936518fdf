#include "zf/storage/segment_io.h"

#include <algorithm>
#include <cstring>
#include <iomanip>
#include <limits>
#include <sstream>
#include <system_error>

#include "zf/common.h"
#include "zf/error.h"

namespace zf::storage {

namespace {

std::streamoff ToStreamOffset(uint64_t offset) {
  static_assert(sizeof(std::streamoff) >= sizeof(int64_t), "segment I/O requires 64-bit stream offsets");
  if (offset > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Segment offset exceeds stream range"};
  }
  return static_cast<std::streamoff>(offset);
}

void CheckRange(uint64_t offset, size_t length, uint64_t size) {
  if (offset > size || length > size - offset) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed,
                "Read of " + std::to_string(length) + " bytes at " + std::to_string(offset) +
                    " exceeds segment size " + std::to_string(size)};
  }
}

}  // namespace

std::vector<uint8_t> SegmentSource::Read(uint64_t offset, size_t length) const {
  std::vector<uint8_t> out(length);
  ReadAt(offset, out);
  return out;
}

FileSegmentSink::FileSegmentSink(std::filesystem::path path) : path_(std::move(path)) {
  file_.open(path_, std::ios::binary | std::ios::in | std::ios::out | std::ios::trunc);
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "Failed to create segment file " + zf::PathToUtf8String(path_)};
  }
}

FileSegmentSink::~FileSegmentSink() {
  if (file_.is_open()) {
    file_.flush();
    file_.close();
  }
}

void FileSegmentSink::Append(std::span<const uint8_t> data) {
  WriteAt(size_, data);
}

void FileSegmentSink::WriteAt(uint64_t offset, std::span<const uint8_t> data) {
  if (offset > size_) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Segment write would leave a gap"};
  }
  file_.seekp(ToStreamOffset(offset));
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Failed to seek for write"};
  }
  file_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed,
                "Failed to write segment file " + zf::PathToUtf8String(path_)};
  }
  size_ = std::max<uint64_t>(size_, offset + data.size());
}

void FileSegmentSink::Close() {
  if (!file_.is_open()) {
    return;
  }
  file_.flush();
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Failed to flush segment file"};
  }
  file_.close();
}

FileSegmentSource::FileSegmentSource(std::filesystem::path path) : path_(std::move(path)) {
  std::error_code ec;
  size_ = std::filesystem::file_size(path_, ec);
  if (ec) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "Failed to stat segment file " + zf::PathToUtf8String(path_), ec.value()};
  }
  file_.open(path_, std::ios::binary);
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kOpenFailed,
                "Failed to open segment file " + zf::PathToUtf8String(path_)};
  }
}

void FileSegmentSource::ReadAt(uint64_t offset, std::span<uint8_t> out) const {
  CheckRange(offset, out.size(), size_);
  std::scoped_lock lock(io_mutex_);
  file_.clear();
  file_.seekg(ToStreamOffset(offset));
  if (!file_) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed, "Failed to seek for read"};
  }
  file_.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
  if (file_.gcount() != static_cast<std::streamsize>(out.size())) {
    throw Error{ErrorDomain::IO, errors::io::kReadFailed,
                "Short read from segment file " + zf::PathToUtf8String(path_)};
  }
}

MemorySegmentSink::MemorySegmentSink(std::shared_ptr<std::vector<uint8_t>> buffer)
    : buffer_(std::move(buffer)) {
  buffer_->clear();
}

void MemorySegmentSink::Append(std::span<const uint8_t> data) {
  buffer_->insert(buffer_->end(), data.begin(), data.end());
}

void MemorySegmentSink::WriteAt(uint64_t offset, std::span<const uint8_t> data) {
  if (offset > buffer_->size()) {
    throw Error{ErrorDomain::IO, errors::io::kWriteFailed, "Segment write would leave a gap"};
  }
  const size_t end = static_cast<size_t>(offset) + data.size();
  if (end > buffer_->size()) {
    buffer_->resize(end);
  }
  std::copy(data.begin(), data.end(), buffer_->begin() + static_cast<std::ptrdiff_t>(offset));
}

void MemorySegmentSource::ReadAt(uint64_t offset, std::span<uint8_t> out) const {
  CheckRange(offset, out.size(), bytes_.size());
  std::memcpy(out.data(), bytes_.data() + offset, out.size());
}

std::filesystem::path SegmentFileName(const std::filesystem::path& base, uint64_t split_number) {
  std::ostringstream suffix;
  suffix << ".z" << std::setw(2) << std::setfill('0') << split_number;
  std::filesystem::path out = base;
  out += suffix.str();
  return out;
}

SegmentSinkFactory FileSinkFactory(std::filesystem::path base) {
  return [base = std::move(base)](uint64_t split_number) -> std::unique_ptr<SegmentSink> {
    return std::make_unique<FileSegmentSink>(SegmentFileName(base, split_number));
  };
}

SegmentSinkFactory MemorySinkCollection::Factory() {
  return [this](uint64_t split_number) -> std::unique_ptr<SegmentSink> {
    if (split_number != buffers_.size() + 1) {
      throw Error{ErrorDomain::Internal, errors::internal::kInvalidState, "Segments requested out of order"};
    }
    buffers_.push_back(std::make_shared<std::vector<uint8_t>>());
    return std::make_unique<MemorySegmentSink>(buffers_.back());
  };
}

std::vector<std::vector<uint8_t>> MemorySinkCollection::Segments() const {
  std::vector<std::vector<uint8_t>> out;
  out.reserve(buffers_.size());
  for (const auto& buffer : buffers_) {
    out.push_back(*buffer);
  }
  return out;
}

std::vector<std::unique_ptr<SegmentSource>> OpenSegmentFiles(const std::vector<std::filesystem::path>& paths) {
  std::vector<std::unique_ptr<SegmentSource>> sources;
  sources.reserve(paths.size());
  for (const auto& path : paths) {
    sources.push_back(std::make_unique<FileSegmentSource>(path));
  }
  return sources;
}

std::vector<std::unique_ptr<SegmentSource>> MemorySources(std::vector<std::vector<uint8_t>> segments) {
  std::vector<std::unique_ptr<SegmentSource>> sources;
  sources.reserve(segments.size());
  for (auto& segment : segments) {
    sources.push_back(std::make_unique<MemorySegmentSource>(std::move(segment)));
  }
  return sources;
}

}  // namespace zf::storage
