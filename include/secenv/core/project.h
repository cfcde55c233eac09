#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace secenv::core {

inline constexpr std::string_view kContainerFileName = ".secenv";
inline constexpr std::string_view kContainerExtension = ".secenv";
inline constexpr std::string_view kRemoteFileName = "backup.secenv";
inline constexpr std::string_view kProjectEntropyTag = "securedenv-v1";
inline constexpr std::size_t kProjectHashLength = 16;

struct ProjectIdentity {
  std::string name;
  std::string hash; // first 16 hex chars of SHA-256(name)
};

// Identity of the project rooted at |project_root|: its basename and the
// truncated digest of that basename. Recomputed on every call. Throws
// Error{Validation, kInvalidProject} when no basename can be derived.
ProjectIdentity Identify(const std::filesystem::path& project_root);

// Identity for a literal project name, e.g. one recorded in a container.
ProjectIdentity IdentityForName(std::string_view name);

// SHA-256(name || "securedenv-v1"); binds derived keys to the project.
std::array<uint8_t, 32> ProjectEntropy(const ProjectIdentity& identity);

class StorageLayout {
public:
  explicit StorageLayout(std::filesystem::path storage_root) : root_(std::move(storage_root)) {}

  const std::filesystem::path& Root() const noexcept { return root_; }
  std::filesystem::path ProjectDirectory(const ProjectIdentity& identity) const;
  // <root>/<hash>/.secenv
  std::filesystem::path LocalContainerPath(const ProjectIdentity& identity) const;
  // <name>/backup.secenv, always '/'-separated
  static std::string RemotePath(const ProjectIdentity& identity);

private:
  std::filesystem::path root_;
};

}  // namespace secenv::core
