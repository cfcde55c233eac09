#include "secenv/crypto/pbkdf2.h"

#include <algorithm>

#include "secenv/crypto/provider.h"

namespace secenv::crypto {

std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations) {
  auto provider = GetCryptoProviderShared();
  return provider->PBKDF2HMACSHA256(password, salt, std::max<uint32_t>(iterations, 1u));
}

}  // namespace secenv::crypto
