#pragma once
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace zf::security {

// Wipes key material and plaintext buffers in a way the optimizer cannot elide.
class Zeroizer {
public:
  static void Wipe(std::span<uint8_t> data) noexcept;

  template <typename T>
  static void WipeVector(std::vector<T>& vec) noexcept {
    Wipe(std::as_writable_bytes(std::span<T>(vec)));
  }

  // Wipes the viewed buffer when the enclosing scope exits, on both normal and exceptional paths.
  template <typename T>
  class ScopeWiper {
  public:
    explicit ScopeWiper(std::span<T> view) noexcept : view_(view) {}
    ~ScopeWiper() noexcept { Zeroizer::Wipe(std::as_writable_bytes(view_)); }

    ScopeWiper(const ScopeWiper&) = delete;
    ScopeWiper& operator=(const ScopeWiper&) = delete;

  private:
    std::span<T> view_;
  };

private:
  static void Wipe(std::span<std::byte> data) noexcept;
};

}  // namespace zf::security
