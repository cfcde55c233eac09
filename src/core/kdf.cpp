#include "secenv/core/kdf.h"

#include <string>
#include <vector>

#include "secenv/core/key_validator.h"
#include "secenv/crypto/pbkdf2.h"
#include "secenv/crypto/sha256.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/security/zeroizer.h"

namespace secenv::core {

KdfParams::KdfParams(uint32_t round1, uint32_t round2, uint32_t round3)
    : round1_(round1), round2_(round2), round3_(round3) {
  if (round1 < kRound1Iterations || round2 < kRound2Iterations || round3 < kRound3Iterations) {
    throw Error(ErrorDomain::Config, errors::config::kKdfParams,
                std::string(errors::msg::kKdfIterationsTooLow) + " (" + std::to_string(round1) + "/" +
                    std::to_string(round2) + "/" + std::to_string(round3) + ")");
  }
}

DerivedKey DeriveKey(const KeyMaterial& material,
                     std::span<const uint8_t, kSaltSize> salt,
                     const ProjectIdentity& identity,
                     const KdfParams& params) {
  if (material.IsPassword()) {
    EnforcePasswordPolicy(material.PasswordView());
  }

  auto entropy = ProjectEntropy(identity);
  security::Zeroizer::ScopeWiper entropy_guard(std::span<uint8_t>(entropy.data(), entropy.size()));

  std::vector<uint8_t> salted(salt.begin(), salt.end());
  salted.insert(salted.end(), entropy.begin(), entropy.end());
  security::Zeroizer::ScopeWiper salted_guard(std::span<uint8_t>(salted.data(), salted.size()));

  auto k1 = crypto::PBKDF2_HMAC_SHA256(material.Secret(), salt, params.round1());
  security::Zeroizer::ScopeWiper k1_guard(std::span<uint8_t>(k1.data(), k1.size()));

  auto k2 = crypto::PBKDF2_HMAC_SHA256(std::span<const uint8_t>(k1.data(), k1.size()),
                                       std::span<const uint8_t>(salted.data(), salted.size()),
                                       params.round2());
  security::Zeroizer::ScopeWiper k2_guard(std::span<uint8_t>(k2.data(), k2.size()));

  const auto final_salt = crypto::SHA256_Hash(salted);
  return crypto::PBKDF2_HMAC_SHA256(std::span<const uint8_t>(k2.data(), k2.size()),
                                    std::span<const uint8_t>(final_salt.data(), final_salt.size()),
                                    params.round3());
}

}  // namespace secenv::core
