#include "secenv/security/zeroizer.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <span>

#if defined(_WIN32)
#define NOMINMAX
#include <windows.h>
#endif

namespace secenv::security {
  namespace {

    inline void PortableZero(std::span<uint8_t> data) noexcept {
      if (data.empty()) {
        return;
      }

#if defined(_WIN32)
      ::SecureZeroMemory(data.data(), static_cast<SIZE_T>(data.size()));
#else
      volatile uint8_t* ptr = reinterpret_cast<volatile uint8_t*>(data.data());
      for (std::size_t i = 0; i < data.size(); ++i) {
        ptr[i] = 0;
      }
#if defined(__GNUC__) || defined(__clang__)
      __asm__ __volatile__("" ::: "memory");
#endif
#endif
      std::atomic_thread_fence(std::memory_order_seq_cst);
    }

  } // namespace

  void Zeroizer::Wipe(std::span<uint8_t> data) noexcept {
    if (data.empty()) {
      return;
    }
    PortableZero(data);
    std::atomic_signal_fence(std::memory_order_seq_cst);
  }

} // namespace secenv::security
