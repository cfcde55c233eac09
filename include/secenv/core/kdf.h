#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "secenv/core/key_material.h"
#include "secenv/core/project.h"

namespace secenv::core {

inline constexpr std::size_t kSaltSize = 32;
inline constexpr std::size_t kDerivedKeySize = 32;

// Iteration counts of the three stretching rounds. Values below the
// defaults are rejected so the work factor never drops.
class KdfParams {
public:
  static constexpr uint32_t kRound1Iterations = 500000;
  static constexpr uint32_t kRound2Iterations = 100000;
  static constexpr uint32_t kRound3Iterations = 50000;

  KdfParams() = default;
  // Throws Error{Config, kKdfParams} when any count is below its minimum.
  KdfParams(uint32_t round1, uint32_t round2, uint32_t round3);

  uint32_t round1() const noexcept { return round1_; }
  uint32_t round2() const noexcept { return round2_; }
  uint32_t round3() const noexcept { return round3_; }

private:
  uint32_t round1_{kRound1Iterations};
  uint32_t round2_{kRound2Iterations};
  uint32_t round3_{kRound3Iterations};
};

using DerivedKey = std::array<uint8_t, kDerivedKeySize>;

// Three-round PBKDF2-HMAC-SHA256:
//   k1 = PBKDF2(secret, salt, r1)
//   k2 = PBKDF2(k1, salt || entropy, r2)
//   k  = PBKDF2(k2, SHA256(salt || entropy), r3)
// Password material passes the strength gate first and raises WeakKeyError.
// Callers wipe the returned key.
DerivedKey DeriveKey(const KeyMaterial& material,
                     std::span<const uint8_t, kSaltSize> salt,
                     const ProjectIdentity& identity,
                     const KdfParams& params = {});

}  // namespace secenv::core
