#include "zf/security/zeroizer.h"

#include <atomic>
#include <cstring>

namespace zf::security {

void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
  Wipe(std::as_writable_bytes(data));
}

void Zeroizer::Wipe(std::span<std::byte> data) noexcept {
  if (data.empty()) {
    return;
  }
  std::memset(data.data(), 0, data.size());
#if defined(__GNUC__) || defined(__clang__)
  // Makes the zeroed memory observable so the memset stays.
  __asm__ __volatile__("" : : "r"(data.data()) : "memory");
#else
  volatile std::byte* tail = data.data();
  for (std::size_t i = 0; i < data.size(); ++i) {
    tail[i] = std::byte{0};
  }
#endif
  std::atomic_thread_fence(std::memory_order_seq_cst);
}

}  // namespace zf::security
