#pragma once

#include <array>
#include <cstdint>
#include <span>

namespace secenv::crypto {

// PBKDF2 with an HMAC-SHA-256 core and a fixed 32-byte output (one block).
std::array<uint8_t, 32> PBKDF2_HMAC_SHA256(std::span<const uint8_t> password,
                                           std::span<const uint8_t> salt,
                                           uint32_t iterations);

}  // namespace secenv::crypto
