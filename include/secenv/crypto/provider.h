#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <vector>

#include "secenv/crypto/aes_gcm.h"

namespace secenv::crypto {

class CryptoProvider {
public:
  virtual ~CryptoProvider() = default;

  virtual AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  // Returns the plaintext only after the tag verified. Throws
  // DecryptionFailureError on tag mismatch.
  virtual std::vector<uint8_t> DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) = 0;

  virtual std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) = 0;

  virtual std::array<uint8_t, 32> PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations) = 0;
};

class OpenSSLCryptoProvider : public CryptoProvider {
public:
  AES256_GCM::EncryptionResult EncryptAES256GCM(
      std::span<const uint8_t> plaintext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  std::vector<uint8_t> DecryptAES256GCM(
      std::span<const uint8_t> ciphertext,
      std::span<const uint8_t> aad,
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
      std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
      std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) override;

  std::array<uint8_t, 32> SHA256(
      std::span<const uint8_t> data) override;

  std::array<uint8_t, 32> PBKDF2HMACSHA256(
      std::span<const uint8_t> password,
      std::span<const uint8_t> salt,
      uint32_t iterations) override;
};

std::shared_ptr<CryptoProvider> GetCryptoProviderShared();
CryptoProvider& GetCryptoProvider();
void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider);
void EnsureCryptoProviderInitialized();
void ResetCryptoProviderForTesting();

}  // namespace secenv::crypto
