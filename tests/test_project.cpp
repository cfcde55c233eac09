#include "secenv/common.h"
#include "secenv/core/project.h"
#include "secenv/error.h"

#include <cassert>
#include <filesystem>
#include <iostream>

#include "test_support.h"

namespace {

void TestIdentityFromDirectory() {
  secenv::testing::TempDir temp("secenv_project_");
  const auto root = temp.path() / "my-app";
  std::filesystem::create_directories(root);

  auto identity = secenv::core::Identify(root);
  assert(identity.name == "my-app");
  assert(identity.hash == "4c9a75cca717efb6");
  assert(identity.hash.size() == secenv::core::kProjectHashLength);

  // Trailing separators and dot segments do not change the identity.
  auto trailing = secenv::core::Identify(std::filesystem::path(root.string() + "/"));
  assert(trailing.name == identity.name && trailing.hash == identity.hash);
  auto dotted = secenv::core::Identify(root / "sub" / "..");
  assert(dotted.name == "my-app");
}

void TestSameNameSameIdentity() {
  secenv::testing::TempDir a("secenv_project_a_");
  secenv::testing::TempDir b("secenv_project_b_");
  std::filesystem::create_directories(a.path() / "shared");
  std::filesystem::create_directories(b.path() / "shared");
  auto first = secenv::core::Identify(a.path() / "shared");
  auto second = secenv::core::Identify(b.path() / "shared");
  assert(first.hash == second.hash);
  assert(secenv::core::IdentityForName("shared").hash == first.hash);
}

void TestRootHasNoIdentity() {
  bool raised = false;
  try {
    (void)secenv::core::Identify(std::filesystem::path("/"));
  } catch (const secenv::Error& err) {
    raised = true;
    assert(err.domain == secenv::ErrorDomain::Validation);
    assert(err.code == secenv::errors::validation::kInvalidProject);
  }
  assert(raised);
}

#if !defined(_WIN32)
void TestNonUtf8DirectoryRejected() {
  secenv::testing::TempDir temp("secenv_project_utf8_");
  const auto root = temp.path() / std::string("app\xff");
  std::filesystem::create_directories(root);
  bool raised = false;
  try {
    (void)secenv::core::Identify(root);
  } catch (const secenv::Error& err) {
    raised = true;
    assert(err.domain == secenv::ErrorDomain::Validation);
    assert(err.code == secenv::errors::validation::kInvalidProject);
  }
  assert(raised);
}
#endif

void TestEntropy() {
  auto entropy = secenv::core::ProjectEntropy(secenv::core::IdentityForName("my-app"));
  assert(secenv::ToHex(entropy) == "c93c874d9398f94eb826365ad832882ea0669b2c5c02e509938f1b1c6e5f5a74");
}

void TestStorageLayout() {
  secenv::core::StorageLayout layout("/var/lib/secenv");
  auto identity = secenv::core::IdentityForName("my-app");
  assert(layout.ProjectDirectory(identity) == std::filesystem::path("/var/lib/secenv/4c9a75cca717efb6"));
  assert(layout.LocalContainerPath(identity) ==
         std::filesystem::path("/var/lib/secenv/4c9a75cca717efb6/.secenv"));
  assert(secenv::core::StorageLayout::RemotePath(identity) == "my-app/backup.secenv");
}

} // namespace

int main() {
  TestIdentityFromDirectory();
  TestSameNameSameIdentity();
  TestRootHasNoIdentity();
#if !defined(_WIN32)
  TestNonUtf8DirectoryRejected();
#endif
  TestEntropy();
  TestStorageLayout();
  std::cout << "project identity tests ok\n";
  return 0;
}
