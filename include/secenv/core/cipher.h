#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "secenv/core/kdf.h"
#include "secenv/core/key_material.h"
#include "secenv/core/project.h"
#include "secenv/crypto/aes_gcm.h"

namespace secenv::core {

inline constexpr std::size_t kNonceSize = crypto::AES256_GCM::NONCE_SIZE;
inline constexpr std::size_t kTagSize = crypto::AES256_GCM::TAG_SIZE;

// One encrypted file plus the material needed to re-derive its key.
struct EncryptedBlob {
  std::vector<uint8_t> ciphertext;
  std::array<uint8_t, kSaltSize> salt{};
  std::array<uint8_t, kNonceSize> nonce{};
  std::array<uint8_t, kTagSize> tag{};

  bool operator==(const EncryptedBlob&) const = default;
};

// AES-256-GCM under a key derived from |material| and a fresh random salt.
// Salt and nonce are drawn from the system CSPRNG on every call.
EncryptedBlob Encrypt(std::span<const uint8_t> plaintext,
                      const KeyMaterial& material,
                      const ProjectIdentity& identity,
                      const KdfParams& params = {});

// Re-derives the key from the blob's salt and verifies the tag before
// returning plaintext. Throws DecryptionFailureError on wrong key or tampering.
std::vector<uint8_t> Decrypt(const EncryptedBlob& blob,
                             const KeyMaterial& material,
                             const ProjectIdentity& identity,
                             const KdfParams& params = {});

}  // namespace secenv::core
