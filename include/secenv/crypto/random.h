#pragma once

#include <cstdint>
#include <span>

namespace secenv::crypto {

// Fills |out| from the operating system CSPRNG. Throws secenv::Error when no
// entropy source is available.
void SystemRandomBytes(std::span<uint8_t> out);

}  // namespace secenv::crypto
