#include "secenv/core/cipher.h"

#include "secenv/crypto/random.h"
#include "secenv/security/zeroizer.h"

namespace secenv::core {

EncryptedBlob Encrypt(std::span<const uint8_t> plaintext,
                      const KeyMaterial& material,
                      const ProjectIdentity& identity,
                      const KdfParams& params) {
  EncryptedBlob blob;
  crypto::SystemRandomBytes(std::span<uint8_t>(blob.salt.data(), blob.salt.size()));
  crypto::SystemRandomBytes(std::span<uint8_t>(blob.nonce.data(), blob.nonce.size()));

  auto key = DeriveKey(material, std::span<const uint8_t, kSaltSize>(blob.salt), identity, params);
  security::Zeroizer::ScopeWiper key_guard(std::span<uint8_t>(key.data(), key.size()));

  auto result = crypto::AES256_GCM_Encrypt(
      plaintext, {},
      std::span<const uint8_t, kNonceSize>(blob.nonce),
      std::span<const uint8_t, crypto::AES256_GCM::KEY_SIZE>(key));
  blob.ciphertext = std::move(result.ciphertext);
  blob.tag = result.tag;
  return blob;
}

std::vector<uint8_t> Decrypt(const EncryptedBlob& blob,
                             const KeyMaterial& material,
                             const ProjectIdentity& identity,
                             const KdfParams& params) {
  auto key = DeriveKey(material, std::span<const uint8_t, kSaltSize>(blob.salt), identity, params);
  security::Zeroizer::ScopeWiper key_guard(std::span<uint8_t>(key.data(), key.size()));

  return crypto::AES256_GCM_Decrypt(
      std::span<const uint8_t>(blob.ciphertext.data(), blob.ciphertext.size()), {},
      std::span<const uint8_t, kNonceSize>(blob.nonce),
      std::span<const uint8_t, kTagSize>(blob.tag),
      std::span<const uint8_t, crypto::AES256_GCM::KEY_SIZE>(key));
}

}  // namespace secenv::core
