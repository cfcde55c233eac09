#include "secenv/error.h"
#include "secenv/orchestrator/env_files.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using secenv::orchestrator::FindEnvFiles;
using secenv::orchestrator::IsEligibleEnvFileName;

void TestEligibleNames() {
  assert(IsEligibleEnvFileName(".env"));
  assert(IsEligibleEnvFileName(".env.local"));
  assert(IsEligibleEnvFileName(".env.production"));
  assert(IsEligibleEnvFileName(".envrc"));
  assert(!IsEligibleEnvFileName(".env.example"));
  assert(!IsEligibleEnvFileName(".env.template"));
  assert(!IsEligibleEnvFileName(".env.secenv"));
  assert(!IsEligibleEnvFileName("env"));
  assert(!IsEligibleEnvFileName("production.env"));
}

void TestFindIsSortedAndShallow() {
  secenv::testing::TempDir temp("secenv_envfiles_");
  const auto& root = temp.path();
  secenv::testing::WriteText(root / ".env.prod", "B=2\n");
  secenv::testing::WriteText(root / ".env", "A=1\n");
  secenv::testing::WriteText(root / ".env.example", "A=\n");
  secenv::testing::WriteText(root / "README.md", "# readme\n");
  std::filesystem::create_directories(root / ".env.d");
  std::filesystem::create_directories(root / "nested");
  secenv::testing::WriteText(root / "nested" / ".env", "C=3\n");

  auto names = FindEnvFiles(root);
  assert((names == std::vector<std::string>{".env", ".env.prod"}));
}

void TestEmptyAndMissingDirectories() {
  secenv::testing::TempDir temp("secenv_envfiles_empty_");
  assert(FindEnvFiles(temp.path()).empty());
  assert(secenv::testing::Throws<secenv::Error>([&] { (void)FindEnvFiles(temp.path() / "absent"); }));
}

#if !defined(_WIN32)
void TestNonUtf8NameRejected() {
  secenv::testing::TempDir temp("secenv_envfiles_utf8_");
  const auto& root = temp.path();
  secenv::testing::WriteText(root / ".env", "A=1\n");
  secenv::testing::WriteText(root / std::string(".env.\xff"), "B=2\n");

  assert(!IsEligibleEnvFileName(".env.\xff"));
  try {
    (void)FindEnvFiles(root);
    assert(false && "expected a validation error");
  } catch (const secenv::Error& err) {
    assert(err.domain == secenv::ErrorDomain::Validation);
    assert(err.code == secenv::errors::validation::kInvalidFileName);
    assert(std::string(err.what()).find("\\xff") != std::string::npos);
  }

  // An excluded name is skipped before its encoding matters.
  std::filesystem::remove(root / std::string(".env.\xff"));
  secenv::testing::WriteText(root / std::string(".env.\xff.example"), "B=\n");
  assert((FindEnvFiles(root) == std::vector<std::string>{".env"}));
}
#endif

} // namespace

int main() {
  TestEligibleNames();
  TestFindIsSortedAndShallow();
  TestEmptyAndMissingDirectories();
#if !defined(_WIN32)
  TestNonUtf8NameRejected();
#endif
  std::cout << "env file enumeration tests ok\n";
  return 0;
}
