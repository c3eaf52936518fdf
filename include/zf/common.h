#pragma once
#include <array>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <type_traits>

namespace zf {
namespace detail {

template <class T>
  requires std::is_unsigned_v<T>
[[nodiscard]] constexpr T ReverseBytes(T value) noexcept {
  if (!std::is_constant_evaluated()) {
#if defined(__clang__) || defined(__GNUC__)
    if constexpr (sizeof(T) == 2) {
      return __builtin_bswap16(value);
    } else if constexpr (sizeof(T) == 4) {
      return __builtin_bswap32(value);
    } else if constexpr (sizeof(T) == 8) {
      return __builtin_bswap64(value);
    }
#endif
  }
  T result = 0;
  for (std::size_t i = 0; i < sizeof(T); ++i) {
    result = static_cast<T>((result << 8) | ((value >> (8 * i)) & 0xFF));
  }
  return result;
}

template <class T>
[[nodiscard]] constexpr T SwapUnless(std::endian wanted, T value) noexcept {
  return std::endian::native == wanted ? value : ReverseBytes(value);
}

}  // namespace detail

// Wire integers are big-endian. GCM-SIV counters and length blocks are little-endian.
constexpr std::uint16_t ToBigEndian16(std::uint16_t v) noexcept { return detail::SwapUnless(std::endian::big, v); }
constexpr std::uint32_t ToBigEndian32(std::uint32_t v) noexcept { return detail::SwapUnless(std::endian::big, v); }
constexpr std::uint64_t ToBigEndian64(std::uint64_t v) noexcept { return detail::SwapUnless(std::endian::big, v); }
constexpr std::uint16_t FromBigEndian16(std::uint16_t v) noexcept { return ToBigEndian16(v); }
constexpr std::uint32_t FromBigEndian32(std::uint32_t v) noexcept { return ToBigEndian32(v); }
constexpr std::uint64_t FromBigEndian64(std::uint64_t v) noexcept { return ToBigEndian64(v); }
constexpr std::uint32_t ToLittleEndian32(std::uint32_t v) noexcept { return detail::SwapUnless(std::endian::little, v); }
constexpr std::uint64_t ToLittleEndian64(std::uint64_t v) noexcept { return detail::SwapUnless(std::endian::little, v); }

// Object representation of a trivially copyable value, e.g. an integer already in wire order.
template <class T>
  requires std::is_trivially_copyable_v<T>
std::span<const std::uint8_t> AsBytesConst(const T& object) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(std::addressof(object)), sizeof(T)};
}

inline std::span<const std::uint8_t> AsBytes(std::string_view text) noexcept {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

inline std::string ToHex(std::span<const std::uint8_t> bytes) {
  constexpr std::string_view kNibbles = "0123456789abcdef";
  std::string hex(bytes.size() * 2, '0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    hex[2 * i] = kNibbles[bytes[i] >> 4];
    hex[2 * i + 1] = kNibbles[bytes[i] & 0x0F];
  }
  return hex;
}

// Segment paths end up in error messages and events; both are UTF-8.
inline std::string PathToUtf8String(const std::filesystem::path& path) {
  const std::u8string u8 = path.u8string();
  return std::string(u8.begin(), u8.end());
}

}  // namespace zf
