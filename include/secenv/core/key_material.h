#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <utility>
#include <variant>

#include "secenv/common.h"
#include "secenv/security/secure_buffer.h"

namespace secenv::core {

// UTF-8 password, subject to the strength policy before derivation.
struct Password {
  security::SecureBuffer<uint8_t> bytes;
};

// Opaque key-file contents. Any length, no content policy.
struct RawKey {
  security::SecureBuffer<uint8_t> bytes;
};

// Exactly one variant is active per operation.
class KeyMaterial {
public:
  static KeyMaterial FromPassword(std::string_view password) {
    return KeyMaterial(Password{security::SecureBuffer<uint8_t>(AsBytes(password))});
  }

  static KeyMaterial FromRawKey(std::span<const uint8_t> bytes) {
    return KeyMaterial(RawKey{security::SecureBuffer<uint8_t>(bytes)});
  }

  bool IsPassword() const noexcept { return std::holds_alternative<Password>(value_); }
  bool IsRawKey() const noexcept { return std::holds_alternative<RawKey>(value_); }

  // Input to the first stretching round, whichever variant is active.
  std::span<const uint8_t> Secret() const noexcept {
    return std::visit([](const auto& v) { return v.bytes.AsSpan(); }, value_);
  }

  std::string_view PasswordView() const noexcept {
    if (const auto* pw = std::get_if<Password>(&value_)) {
      return {reinterpret_cast<const char*>(pw->bytes.data()), pw->bytes.size()};
    }
    return {};
  }

private:
  explicit KeyMaterial(Password p) : value_(std::move(p)) {}
  explicit KeyMaterial(RawKey k) : value_(std::move(k)) {}

  std::variant<Password, RawKey> value_;
};

}  // namespace secenv::core
