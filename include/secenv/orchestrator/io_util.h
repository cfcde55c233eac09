#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <span>
#include <vector>

#include "secenv/error.h"

namespace secenv::orchestrator {

// Test seams for crash simulation. |on_write_progress| runs after every chunk
// written to the temporary file; throwing from either hook aborts the replace
// and leaves the previous target untouched.
struct AtomicReplaceHooks {
  std::function<void(const std::filesystem::path&, const std::filesystem::path&)> before_rename;
  std::function<void(size_t written, size_t total)> on_write_progress;
};

// Performs an atomic replace of the target file by writing the payload to a
// temporary file in the same directory with owner-only permissions, syncing
// it to disk, then renaming it into place.
void AtomicReplace(const std::filesystem::path& target, std::span<const uint8_t> payload,
                   const AtomicReplaceHooks& hooks = {});

// Reads the whole file. Throws Error{IO, kSourceMissing} when |path| does not
// name a regular file and Error{IO, kReadFailed} on read errors.
std::vector<uint8_t> ReadFileBytes(const std::filesystem::path& path);

// Creates |dir| and missing parents with owner-only permissions.
void EnsurePrivateDirectory(const std::filesystem::path& dir);

}  // namespace secenv::orchestrator
