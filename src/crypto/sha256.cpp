#include "secenv/crypto/sha256.h"

#include "secenv/common.h"
#include "secenv/crypto/provider.h"

namespace secenv::crypto {

std::array<uint8_t, 32> SHA256_Hash(std::span<const uint8_t> data) {
  auto provider = GetCryptoProviderShared();
  return provider->SHA256(data);
}

std::array<uint8_t, 32> SHA256_Hash(const std::vector<uint8_t>& data) {
  return SHA256_Hash(std::span<const uint8_t>(data.data(), data.size()));
}

std::string SHA256_Hex(std::string_view text) {
  const auto digest = SHA256_Hash(AsBytes(text));
  return ToHex(std::span<const uint8_t>(digest.data(), digest.size()));
}

}  // namespace secenv::crypto
