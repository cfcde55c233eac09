#include "secenv/error.h"
#include "secenv/orchestrator/key_resolver.h"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using secenv::KeyConfigError;
using secenv::KeyConfigReason;
using secenv::orchestrator::KeyOptions;
using secenv::orchestrator::ResolveKey;

KeyConfigReason ReasonFor(const KeyOptions& options) {
  try {
    (void)ResolveKey(options);
  } catch (const KeyConfigError& err) {
    assert(err.domain == secenv::ErrorDomain::Config);
    return err.reason;
  }
  assert(false && "expected KeyConfigError");
  return KeyConfigReason::kMissing;
}

void TestPassword() {
  auto material = ResolveKey(KeyOptions::WithPassword("Str0ng!Pass99"));
  assert(material.IsPassword());
  assert(material.PasswordView() == "Str0ng!Pass99");
}

void TestKeyFileBytesVerbatim() {
  secenv::testing::TempDir temp("secenv_keyfile_");
  const auto path = temp.path() / "master.key";
  const std::vector<uint8_t> bytes{0x00, 0xFF, 0x10, '\n', 0x7F};
  secenv::testing::WriteBytes(path, bytes);

  auto material = ResolveKey(KeyOptions::WithKeyFile(path));
  assert(material.IsRawKey());
  auto secret = material.Secret();
  assert(std::vector<uint8_t>(secret.begin(), secret.end()) == bytes);
  assert(material.PasswordView().empty());
}

void TestErrors() {
  assert(ReasonFor(KeyOptions{}) == KeyConfigReason::kMissing);

  KeyOptions both;
  both.password = "Str0ng!Pass99";
  both.key_file = "/nonexistent/key";
  assert(ReasonFor(both) == KeyConfigReason::kMutuallyExclusive);

  secenv::testing::TempDir temp("secenv_keyfile_missing_");
  assert(ReasonFor(KeyOptions::WithKeyFile(temp.path() / "absent.key")) == KeyConfigReason::kUnreadable);
  assert(ReasonFor(KeyOptions::WithKeyFile(temp.path())) == KeyConfigReason::kUnreadable);
}

} // namespace

int main() {
  TestPassword();
  TestKeyFileBytesVerbatim();
  TestErrors();
  std::cout << "key resolver tests ok\n";
  return 0;
}
