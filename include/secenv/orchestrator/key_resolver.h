#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "secenv/core/key_material.h"

namespace secenv::orchestrator {

// Key specification for one operation. Password and key file are mutually
// exclusive.
struct KeyOptions {
  std::optional<std::string> password;
  std::optional<std::filesystem::path> key_file;

  static KeyOptions WithPassword(std::string pw) {
    KeyOptions options;
    options.password = std::move(pw);
    return options;
  }
  static KeyOptions WithKeyFile(std::filesystem::path path) {
    KeyOptions options;
    options.key_file = std::move(path);
    return options;
  }

  bool Empty() const noexcept { return !password && !key_file; }
};

// Turns options into key material. Throws KeyConfigError with reason
// kMutuallyExclusive, kUnreadable or kMissing. Password strength is checked
// later, during derivation.
core::KeyMaterial ResolveKey(const KeyOptions& options);

}  // namespace secenv::orchestrator
