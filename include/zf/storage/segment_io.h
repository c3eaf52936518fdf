#pragma once

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <span>
#include <string>
#include <vector>

namespace zf::storage {

// Destination of one segment's bytes. Writers append sequentially and patch
// the reserved header region once the segment is complete.
class SegmentSink {
public:
  virtual ~SegmentSink() = default;

  virtual void Append(std::span<const uint8_t> data) = 0;
  virtual void WriteAt(uint64_t offset, std::span<const uint8_t> data) = 0;
  virtual uint64_t Size() const = 0;
  virtual void Close() = 0;
};

// Random-access view of one segment's bytes.
class SegmentSource {
public:
  virtual ~SegmentSource() = default;

  virtual uint64_t Size() const = 0;
  // Reads exactly |out.size()| bytes at |offset| or throws.
  virtual void ReadAt(uint64_t offset, std::span<uint8_t> out) const = 0;

  std::vector<uint8_t> Read(uint64_t offset, size_t length) const;
};

using SegmentSinkFactory = std::function<std::unique_ptr<SegmentSink>(uint64_t split_number)>;

class FileSegmentSink : public SegmentSink {
public:
  explicit FileSegmentSink(std::filesystem::path path);
  ~FileSegmentSink() override;

  FileSegmentSink(const FileSegmentSink&) = delete;
  FileSegmentSink& operator=(const FileSegmentSink&) = delete;

  void Append(std::span<const uint8_t> data) override;
  void WriteAt(uint64_t offset, std::span<const uint8_t> data) override;
  uint64_t Size() const override { return size_; }
  void Close() override;

private:
  std::filesystem::path path_;
  std::fstream file_;
  uint64_t size_{0};
};

class FileSegmentSource : public SegmentSource {
public:
  explicit FileSegmentSource(std::filesystem::path path);

  uint64_t Size() const override { return size_; }
  void ReadAt(uint64_t offset, std::span<uint8_t> out) const override;

  [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
  std::filesystem::path path_;
  mutable std::ifstream file_;
  mutable std::mutex io_mutex_;
  uint64_t size_{0};
};

// In-memory segment; the buffer is shared so a test or caller can keep a
// handle after the writer has released the sink.
class MemorySegmentSink : public SegmentSink {
public:
  explicit MemorySegmentSink(std::shared_ptr<std::vector<uint8_t>> buffer);

  void Append(std::span<const uint8_t> data) override;
  void WriteAt(uint64_t offset, std::span<const uint8_t> data) override;
  uint64_t Size() const override { return buffer_->size(); }
  void Close() override {}

private:
  std::shared_ptr<std::vector<uint8_t>> buffer_;
};

class MemorySegmentSource : public SegmentSource {
public:
  explicit MemorySegmentSource(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}

  uint64_t Size() const override { return bytes_.size(); }
  void ReadAt(uint64_t offset, std::span<uint8_t> out) const override;

private:
  std::vector<uint8_t> bytes_;
};

// "<base>.z01", "<base>.z02", ...; at least two digits.
std::filesystem::path SegmentFileName(const std::filesystem::path& base, uint64_t split_number);

SegmentSinkFactory FileSinkFactory(std::filesystem::path base);

// Collects segment buffers in split-number order.
class MemorySinkCollection {
public:
  SegmentSinkFactory Factory();
  [[nodiscard]] std::vector<std::vector<uint8_t>> Segments() const;

private:
  std::vector<std::shared_ptr<std::vector<uint8_t>>> buffers_;
};

std::vector<std::unique_ptr<SegmentSource>> OpenSegmentFiles(const std::vector<std::filesystem::path>& paths);
std::vector<std::unique_ptr<SegmentSource>> MemorySources(std::vector<std::vector<uint8_t>> segments);

}  // namespace zf::storage
