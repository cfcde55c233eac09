#include "secenv/crypto/provider.h"

#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/opensslv.h>

#include <algorithm>
#include <array>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

#include "secenv/crypto/ct.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/security/zeroizer.h"

namespace secenv::crypto {

namespace {

[[noreturn]] void ThrowCryptoError(const std::string& message, int code = errors::crypto::kProviderFailure,
                                   std::optional<int> native = std::nullopt) {
  throw secenv::Error(secenv::ErrorDomain::Crypto, code, message, native);
}

std::string BuildOpenSSLErrorMessage(const char* context) {
  unsigned long err = ERR_get_error();
  if (err == 0) {
    return std::string(context) + ": unknown OpenSSL error";
  }

  char buf[256] = {0};
  ERR_error_string_n(err, buf, sizeof(buf));
  std::string message(context);
  message.append(": ");
  message.append(buf);
  return message;
}

class EVPContextDeleter {
public:
  void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, EVPContextDeleter>;

struct RuntimeState {
  std::once_flag once;
  bool kat_passed{false};
};

RuntimeState& MutableRuntimeState() {
  static RuntimeState state{};
  return state;
}

std::mutex& ProviderMutex() {
  static std::mutex mutex;
  return mutex;
}

std::shared_ptr<CryptoProvider>& ProviderInstance() {
  static std::shared_ptr<CryptoProvider> instance;
  return instance;
}

// GCM test case 16 key, plaintext and AAD with a 16-byte IV. A 16-byte IV goes
// through GHASH rather than the 96-bit fast path, which is the mode the
// container format uses.
void RunAESGCMKnownAnswerTest(OpenSSLCryptoProvider& provider) {
  static constexpr std::array<uint8_t, AES256_GCM::KEY_SIZE> kKey{
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08,
      0xfe, 0xff, 0xe9, 0x92, 0x86, 0x65, 0x73, 0x1c,
      0x6d, 0x6a, 0x8f, 0x94, 0x67, 0x30, 0x83, 0x08};
  static constexpr std::array<uint8_t, AES256_GCM::NONCE_SIZE> kNonce{
      0xca, 0xfe, 0xba, 0xbe, 0xfa, 0xce, 0xdb, 0xad,
      0xde, 0xca, 0xf8, 0x88, 0x00, 0x11, 0x22, 0x33};
  static constexpr std::array<uint8_t, 60> kPlaintext{
      0xd9, 0x31, 0x32, 0x25, 0xf8, 0x84, 0x06, 0xe5, 0xa5, 0x59, 0x09, 0xc5,
      0xaf, 0xf5, 0x26, 0x9a, 0x86, 0xa7, 0xa9, 0x53, 0x15, 0x34, 0xf7, 0xda,
      0x2e, 0x4c, 0x30, 0x3d, 0x8a, 0x31, 0x8a, 0x72, 0x1c, 0x3c, 0x0c, 0x95,
      0x95, 0x68, 0x09, 0x53, 0x2f, 0xcf, 0x0e, 0x24, 0x49, 0xa6, 0xb5, 0x25,
      0xb1, 0x6a, 0xed, 0xf5, 0xaa, 0x0d, 0xe6, 0x57, 0xba, 0x63, 0x7b, 0x39};
  static constexpr std::array<uint8_t, 20> kAad{
      0xfe, 0xed, 0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xfe, 0xed,
      0xfa, 0xce, 0xde, 0xad, 0xbe, 0xef, 0xab, 0xad, 0xda, 0xd2};
  static constexpr std::array<uint8_t, 60> kExpectedCiphertext{
      0x03, 0x25, 0xe8, 0xfc, 0x7d, 0x06, 0xcd, 0x6c, 0xbb, 0x9d, 0x5d, 0x13,
      0xf4, 0x62, 0xae, 0x6b, 0x07, 0x71, 0x75, 0x7e, 0x9a, 0x88, 0x54, 0xfa,
      0x6c, 0x44, 0x06, 0x98, 0x49, 0x8f, 0xb1, 0x8a, 0x06, 0xd2, 0x39, 0x5c,
      0x0d, 0x47, 0xad, 0x7a, 0x24, 0xb9, 0x18, 0x61, 0x6c, 0xb9, 0x0c, 0x25,
      0x63, 0x58, 0x53, 0xaa, 0xf9, 0xcb, 0x12, 0x4f, 0x7c, 0x59, 0x7a, 0xd9};
  static constexpr std::array<uint8_t, AES256_GCM::TAG_SIZE> kExpectedTag{
      0x04, 0x97, 0x8e, 0xab, 0x47, 0xf1, 0xfd, 0xa6,
      0xc7, 0xfa, 0xfd, 0x66, 0x58, 0x52, 0xe5, 0xef};

  const auto enc = provider.EncryptAES256GCM(
      std::span<const uint8_t>(kPlaintext.data(), kPlaintext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  if (!ct::CompareEqual(std::span<const uint8_t>(enc.ciphertext),
                        std::span<const uint8_t>(kExpectedCiphertext))) {
    ThrowCryptoError("AES-GCM KAT ciphertext mismatch");
  }
  if (!ct::CompareEqual(enc.tag, kExpectedTag)) {
    ThrowCryptoError("AES-GCM KAT tag mismatch");
  }

  const auto dec = provider.DecryptAES256GCM(
      std::span<const uint8_t>(enc.ciphertext.data(), enc.ciphertext.size()),
      std::span<const uint8_t>(kAad.data(), kAad.size()),
      std::span<const uint8_t, AES256_GCM::NONCE_SIZE>(kNonce),
      std::span<const uint8_t, AES256_GCM::TAG_SIZE>(enc.tag),
      std::span<const uint8_t, AES256_GCM::KEY_SIZE>(kKey));
  if (!ct::CompareEqual(std::span<const uint8_t>(dec), std::span<const uint8_t>(kPlaintext))) {
    ThrowCryptoError("AES-GCM KAT decrypt mismatch");
  }
}

void RunSHA256KnownAnswerTest(OpenSSLCryptoProvider& provider) {
  // FIPS 180-2 "abc"
  static constexpr std::array<uint8_t, 3> kMessage{0x61, 0x62, 0x63};
  static constexpr std::array<uint8_t, 32> kExpected{
      0xba, 0x78, 0x16, 0xbf, 0x8f, 0x01, 0xcf, 0xea, 0x41, 0x41, 0x40, 0xde,
      0x5d, 0xae, 0x22, 0x23, 0xb0, 0x03, 0x61, 0xa3, 0x96, 0x17, 0x7a, 0x9c,
      0xb4, 0x10, 0xff, 0x61, 0xf2, 0x00, 0x15, 0xad};
  const auto digest = provider.SHA256(std::span<const uint8_t>(kMessage.data(), kMessage.size()));
  if (!ct::CompareEqual(digest, kExpected)) {
    ThrowCryptoError("SHA-256 KAT mismatch");
  }
}

void EnsureCryptoRuntimeConfigured() {
  auto& state = MutableRuntimeState();
  std::call_once(state.once, [&state]() {
    OpenSSLCryptoProvider provider;
    RunAESGCMKnownAnswerTest(provider);
    RunSHA256KnownAnswerTest(provider);
    state.kat_passed = true;
    if (std::getenv("SECENV_CRYPTO_TRACE") != nullptr) {
      std::clog << "[crypto] " << OPENSSL_VERSION_TEXT
                << ": AES-GCM and SHA-256 known-answer tests passed" << std::endl;
    }
  });
}

}  // namespace

void EnsureCryptoProviderInitialized() {
  EnsureCryptoRuntimeConfigured();
}

AES256_GCM::EncryptionResult OpenSSLCryptoProvider::EncryptAES256GCM(
    std::span<const uint8_t> plaintext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate aad"));
    }
  }

  AES256_GCM::EncryptionResult result;
  result.ciphertext.resize(plaintext.size());
  int total = 0;
  if (!plaintext.empty()) {
    if (EVP_EncryptUpdate(ctx.get(), result.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptUpdate plaintext"));
    }
    total = len;
  }

  if (EVP_EncryptFinal_ex(ctx.get(), result.ciphertext.data() + total, &len) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
  }
  total += len;
  result.ciphertext.resize(static_cast<size_t>(total));

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                          AES256_GCM::TAG_SIZE, result.tag.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
  }

  return result;
}

std::vector<uint8_t> OpenSSLCryptoProvider::DecryptAES256GCM(
    std::span<const uint8_t> ciphertext,
    std::span<const uint8_t> aad,
    std::span<const uint8_t, AES256_GCM::NONCE_SIZE> nonce,
    std::span<const uint8_t, AES256_GCM::TAG_SIZE> tag,
    std::span<const uint8_t, AES256_GCM::KEY_SIZE> key) {
  CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
  if (!ctx) {
    ThrowCryptoError("Failed to allocate AES-GCM context");
  }

  if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
  }
  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                          static_cast<int>(nonce.size()), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_IVLEN"));
  }
  if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptInit_ex key/iv"));
  }

  int len = 0;
  if (!aad.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), nullptr, &len, aad.data(),
                          static_cast<int>(aad.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate aad"));
    }
  }

  std::vector<uint8_t> plaintext(ciphertext.size());
  int total = 0;
  if (!ciphertext.empty()) {
    if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, ciphertext.data(),
                          static_cast<int>(ciphertext.size())) != 1) {
      ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_DecryptUpdate ciphertext"));
    }
    total = len;
  }

  if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                          AES256_GCM::TAG_SIZE, const_cast<uint8_t*>(tag.data())) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
  }

  int final_len = 0;
  int ret = EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + total, &final_len);
  if (ret <= 0) {
    // Unauthenticated output never leaves this function.
    security::Zeroizer::WipeVector(plaintext);
    ERR_clear_error();
    throw secenv::DecryptionFailureError(std::string(errors::msg::kDecryptionFailed));
  }
  total += final_len;
  plaintext.resize(static_cast<size_t>(total));

  return plaintext;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::SHA256(
    std::span<const uint8_t> data) {
  std::array<uint8_t, 32> out{};
  unsigned int len = 0;
  if (EVP_Digest(data.data(), data.size(), out.data(), &len, EVP_sha256(), nullptr) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("EVP_Digest(EVP_sha256)"));
  }
  if (len != out.size()) {
    ThrowCryptoError("Unexpected SHA-256 length", errors::crypto::kProviderFailure,
                     static_cast<int>(len));
  }
  return out;
}

std::array<uint8_t, 32> OpenSSLCryptoProvider::PBKDF2HMACSHA256(
    std::span<const uint8_t> password,
    std::span<const uint8_t> salt,
    uint32_t iterations) {
  std::array<uint8_t, 32> out{};
  // PKCS5_PBKDF2_HMAC rejects a null password pointer even for length 0.
  static const char kEmpty[1] = {0};
  const char* pass = password.empty() ? kEmpty : reinterpret_cast<const char*>(password.data());
  static const unsigned char kEmptySalt[1] = {0};
  const unsigned char* salt_ptr = salt.empty() ? kEmptySalt : salt.data();
  if (PKCS5_PBKDF2_HMAC(pass, static_cast<int>(password.size()), salt_ptr,
                        static_cast<int>(salt.size()), static_cast<int>(iterations),
                        EVP_sha256(), static_cast<int>(out.size()), out.data()) != 1) {
    ThrowCryptoError(BuildOpenSSLErrorMessage("PKCS5_PBKDF2_HMAC"));
  }
  return out;
}

std::shared_ptr<CryptoProvider> GetCryptoProviderShared() {
  EnsureCryptoRuntimeConfigured();
  std::lock_guard<std::mutex> lock(ProviderMutex());
  auto& provider = ProviderInstance();
  if (!provider) {
    provider = std::make_shared<OpenSSLCryptoProvider>();
  }
  return provider;
}

CryptoProvider& GetCryptoProvider() {
  return *GetCryptoProviderShared();
}

void SetCryptoProvider(std::shared_ptr<CryptoProvider> provider) {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance() = std::move(provider);
}

void ResetCryptoProviderForTesting() {
  std::lock_guard<std::mutex> lock(ProviderMutex());
  ProviderInstance().reset();
}

}  // namespace secenv::crypto
