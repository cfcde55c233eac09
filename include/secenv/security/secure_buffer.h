#pragma once
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include "secenv/security/zeroizer.h"

namespace secenv::security {

// Heap buffer that is zeroized before it is released. Holds passwords, key
// file contents and decrypted env files while they wait to be written.
template<typename T>
class SecureBuffer {
  std::unique_ptr<T[]> ptr_;
  size_t size_{0};

  void Release() noexcept {
    if (ptr_ && size_ > 0) {
      Zeroizer::Wipe(std::span<uint8_t>(reinterpret_cast<uint8_t*>(ptr_.get()), size_ * sizeof(T)));
    }
    ptr_.reset();
    size_ = 0;
  }

public:
  SecureBuffer() noexcept = default;

  explicit SecureBuffer(size_t n) : ptr_(n > 0 ? std::make_unique<T[]>(n) : nullptr), size_(n) {}

  explicit SecureBuffer(std::span<const T> source) : SecureBuffer(source.size()) {
    std::copy(source.begin(), source.end(), ptr_.get());
  }

  ~SecureBuffer() { Release(); }

  SecureBuffer(const SecureBuffer&) = delete;
  SecureBuffer& operator=(const SecureBuffer&) = delete;
  SecureBuffer(SecureBuffer&& o) noexcept : ptr_(std::move(o.ptr_)), size_(o.size_) { o.size_ = 0; }
  SecureBuffer& operator=(SecureBuffer&& o) noexcept {
    if (this != &o) {
      Release();
      ptr_ = std::move(o.ptr_);
      size_ = o.size_;
      o.size_ = 0;
    }
    return *this;
  }

  T* data() noexcept { return ptr_.get(); }
  const T* data() const noexcept { return ptr_.get(); }
  size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  std::span<T> AsSpan() noexcept { return {ptr_.get(), size_}; }
  std::span<const T> AsSpan() const noexcept { return {ptr_.get(), size_}; }
};

} // namespace secenv::security
