#include "secenv/common.h"
#include "secenv/core/cipher.h"
#include "secenv/core/key_validator.h"
#include "secenv/core/project.h"
#include "secenv/error.h"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <set>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using secenv::core::KeyMaterial;

const secenv::core::ProjectIdentity& Project() {
  static const auto identity = secenv::core::IdentityForName("cipher-test");
  return identity;
}

std::string AsString(const std::vector<uint8_t>& bytes) {
  return std::string(bytes.begin(), bytes.end());
}

void TestRoundTripAndWrongKey() {
  const std::string plaintext = "DATABASE_URL=postgres://localhost/app\nSECRET=s3cr3t\n";
  auto material = KeyMaterial::FromPassword("Str0ng!Pass99");
  auto blob = secenv::core::Encrypt(secenv::AsBytes(plaintext), material, Project());
  assert(blob.ciphertext.size() == plaintext.size());
  assert(AsString(secenv::core::Decrypt(blob, material, Project())) == plaintext);

  auto wrong = KeyMaterial::FromPassword("Different!Pass42");
  assert(secenv::testing::Throws<secenv::DecryptionFailureError>(
      [&] { (void)secenv::core::Decrypt(blob, wrong, Project()); }));

  // Same key, different project: the entropy input differs.
  auto other = secenv::core::IdentityForName("another-project");
  assert(secenv::testing::Throws<secenv::DecryptionFailureError>(
      [&] { (void)secenv::core::Decrypt(blob, material, other); }));

  auto tampered = blob;
  tampered.ciphertext[3] ^= 0x20;
  assert(secenv::testing::Throws<secenv::DecryptionFailureError>(
      [&] { (void)secenv::core::Decrypt(tampered, material, Project()); }));
}

void TestFreshSaltAndNonce() {
  std::vector<uint8_t> raw(48, 0x5A);
  auto material = KeyMaterial::FromRawKey(raw);
  std::set<std::string> salts;
  std::set<std::string> nonces;
  std::set<std::string> ciphertexts;
  constexpr int kTrials = 8;
  for (int i = 0; i < kTrials; ++i) {
    auto blob = secenv::core::Encrypt(secenv::AsBytes("A=1\n"), material, Project());
    salts.insert(secenv::ToHex(blob.salt));
    nonces.insert(secenv::ToHex(blob.nonce));
    ciphertexts.insert(secenv::ToHex(blob.ciphertext));
  }
  assert(salts.size() == kTrials);
  assert(nonces.size() == kTrials);
  assert(ciphertexts.size() == kTrials);
}

void TestWeakPasswordNeverEncrypts() {
  auto material = KeyMaterial::FromPassword("abc");
  assert(secenv::testing::Throws<secenv::core::WeakKeyError>(
      [&] { (void)secenv::core::Encrypt(secenv::AsBytes("A=1"), material, Project()); }));
}

void TestKeyFileHasNoStrengthGate() {
  // A one-byte key file is accepted: key files carry no content policy.
  std::vector<uint8_t> raw{0x01};
  auto material = KeyMaterial::FromRawKey(raw);
  auto blob = secenv::core::Encrypt({}, material, Project());
  assert(blob.ciphertext.empty());
  assert(secenv::core::Decrypt(blob, material, Project()).empty());
}

} // namespace

int main() {
  TestWeakPasswordNeverEncrypts();
  TestRoundTripAndWrongKey();
  TestFreshSaltAndNonce();
  TestKeyFileHasNoStrengthGate();
  std::cout << "cipher tests ok\n";
  return 0;
}
