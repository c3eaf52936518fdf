#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <span>
#include <string_view>
#include <vector>

namespace zf::format {

// Magic values, stored big-endian so they read as ASCII on disk.
inline constexpr uint32_t kMainHeaderMagic = 0x7A66666D;          // "zffm"
inline constexpr uint32_t kEncryptedMainHeaderMagic = 0x7A666645; // "zffE"
inline constexpr uint32_t kEncryptionHeaderMagic = 0x7A666665;    // "zffe"
inline constexpr uint32_t kPbeHeaderMagic = 0x7A666670;           // "zffp"
inline constexpr uint32_t kKdfParametersMagic = 0x6B646670;       // "kdfp"
inline constexpr uint32_t kCompressionHeaderMagic = 0x7A666663;   // "zffc"
inline constexpr uint32_t kDescriptionHeaderMagic = 0x7A666664;   // "zffd"
inline constexpr uint32_t kHashHeaderMagic = 0x7A666668;          // "zffh"
inline constexpr uint32_t kHashValueMagic = 0x7A666648;           // "zffH"
inline constexpr uint32_t kSplitHeaderMagic = 0x7A666673;         // "zffs"
inline constexpr uint32_t kChunkHeaderMagic = 0x7A666643;         // "zffC"

inline constexpr size_t kMagicSize = 4;
inline constexpr size_t kLengthSize = 8;
inline constexpr size_t kVersionSize = 1;
inline constexpr size_t kUnversionedPrefixSize = kMagicSize + kLengthSize;
inline constexpr size_t kFramePrefixSize = kUnversionedPrefixSize + kVersionSize;

// Append-only big-endian encoder.
class ByteWriter {
public:
  void PutU8(uint8_t value);
  void PutU16(uint16_t value);
  void PutU32(uint32_t value);
  void PutU64(uint64_t value);
  void PutBytes(std::span<const uint8_t> bytes);

  // Starts a frame (magic, length placeholder, optional version) and returns
  // the frame offset to pass to EndFrame, which patches the length.
  size_t BeginFrame(uint32_t magic, std::optional<uint8_t> version);
  void EndFrame(size_t frame_offset);

  [[nodiscard]] size_t size() const noexcept { return buffer_.size(); }
  [[nodiscard]] const std::vector<uint8_t>& buffer() const noexcept { return buffer_; }
  std::vector<uint8_t> Take() { return std::move(buffer_); }

private:
  std::vector<uint8_t> buffer_;
};

// Bounds-checked big-endian decoder. Reading past the end throws
// zf::Error(kMalformedHeader) naming |kind|.
class ByteReader {
public:
  ByteReader(std::span<const uint8_t> input, std::string_view kind) : input_(input), kind_(kind) {}

  uint8_t U8();
  uint16_t U16();
  uint32_t U32();
  uint64_t U64();
  std::span<const uint8_t> Bytes(size_t count);
  std::span<const uint8_t> Rest();

  [[nodiscard]] size_t consumed() const noexcept { return offset_; }
  [[nodiscard]] size_t remaining() const noexcept { return input_.size() - offset_; }
  [[nodiscard]] bool empty() const noexcept { return offset_ == input_.size(); }
  [[nodiscard]] std::string_view kind() const noexcept { return kind_; }

private:
  std::span<const uint8_t> input_;
  std::string_view kind_;
  size_t offset_{0};
};

template <class Header>
struct Decoded {
  Header header;
  size_t consumed{0};
};

template <class Header>
std::vector<uint8_t> EncodeToVector(const Header& header) {
  ByteWriter writer;
  header.EncodeTo(writer);
  return writer.Take();
}

struct FrameView {
  uint32_t magic{0};
  uint64_t length{0};
  uint8_t version{0};
  std::span<const uint8_t> payload{};
};

// Validates the frame prefix at the start of |input|: magic, declared length
// against the buffer, and version in [1, max_version]. Version 0 is a
// malformed header; a newer version is UnsupportedVersion.
FrameView OpenFrame(std::span<const uint8_t> input, uint32_t expected_magic, uint8_t max_version,
                    std::string_view kind);

// Same checks for objects that carry no version byte.
FrameView OpenUnversionedFrame(std::span<const uint8_t> input, uint32_t expected_magic,
                               std::string_view kind);

// Decoders use this once the payload is parsed so that the declared length
// and the consumed byte count agree.
void ExpectFullyConsumed(const ByteReader& reader);

std::optional<uint32_t> PeekMagic(std::span<const uint8_t> input) noexcept;

// Reads only the magic and declared length; used to size a region before the
// full object is available.
std::optional<uint64_t> PeekFrameLength(std::span<const uint8_t> input) noexcept;

[[noreturn]] void ThrowMalformed(std::string_view kind, std::string_view detail);

}  // namespace zf::format
