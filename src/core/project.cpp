#include "secenv/core/project.h"

#include "secenv/common.h"
#include "secenv/crypto/sha256.h"
#include "secenv/error.h"
#include "secenv/errors.h"

namespace secenv::core {

ProjectIdentity Identify(const std::filesystem::path& project_root) {
  auto absolute = std::filesystem::absolute(project_root).lexically_normal();
  // "/a/b/" normalizes to "/a/b/" with an empty filename
  if (!absolute.has_filename() && absolute.has_relative_path()) {
    absolute = absolute.parent_path();
  }
  const auto name = PathToUtf8String(absolute.filename());
  if (name.empty() || name == "." || name == "..") {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidProject,
                std::string(errors::msg::kInvalidProjectRoot) + ": " + PathToUtf8String(project_root));
  }
  if (!IsValidUtf8(name)) {
    throw Error(ErrorDomain::Validation, errors::validation::kInvalidProject,
                std::string(errors::msg::kProjectNameNotUtf8) + ": " + ToHex(AsBytes(name)));
  }
  return IdentityForName(name);
}

ProjectIdentity IdentityForName(std::string_view name) {
  ProjectIdentity identity;
  identity.name = std::string(name);
  identity.hash = crypto::SHA256_Hex(name).substr(0, kProjectHashLength);
  return identity;
}

std::array<uint8_t, 32> ProjectEntropy(const ProjectIdentity& identity) {
  std::string input = identity.name;
  input.append(kProjectEntropyTag);
  return crypto::SHA256_Hash(AsBytes(input));
}

std::filesystem::path StorageLayout::ProjectDirectory(const ProjectIdentity& identity) const {
  return root_ / identity.hash;
}

std::filesystem::path StorageLayout::LocalContainerPath(const ProjectIdentity& identity) const {
  return ProjectDirectory(identity) / std::string(kContainerFileName);
}

std::string StorageLayout::RemotePath(const ProjectIdentity& identity) {
  std::string path = identity.name;
  path.push_back('/');
  path.append(kRemoteFileName);
  return path;
}

}  // namespace secenv::core
