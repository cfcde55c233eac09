#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace secenv::orchestrator {

struct RemoteBlob {
  std::vector<uint8_t> bytes;
  std::string revision;
};

// Blob store addressed by '/'-separated paths with optimistic concurrency.
class RemoteStore {
public:
  virtual ~RemoteStore() = default;

  // nullopt when nothing is stored at |path|.
  virtual std::optional<RemoteBlob> GetBlob(const std::string& path) = 0;

  // Writes |bytes| and returns the new revision. When |expected_revision| is
  // set the write succeeds only if it still names the current revision; when
  // unset the path must be empty. Throws Error{Remote, kRemoteConflict}
  // otherwise.
  virtual std::string PutBlob(const std::string& path, std::span<const uint8_t> bytes,
                              const std::optional<std::string>& expected_revision) = 0;
};

}  // namespace secenv::orchestrator
