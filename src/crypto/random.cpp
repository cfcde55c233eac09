#include "secenv/crypto/random.h"

#include <cerrno>
#include <cstdint>
#include <fstream>
#include <span>

#if defined(_WIN32)
#include <windows.h>
#include <bcrypt.h>
#if defined(_MSC_VER)
#pragma comment(lib, "bcrypt.lib")
#endif
#if !defined(BCRYPT_SUCCESS)
#define BCRYPT_SUCCESS(status) ((status) >= 0)
#endif
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
#include <stdlib.h>
#elif defined(__linux__) || defined(__ANDROID__)
#include <sys/random.h>
#include <unistd.h>
#endif

#include "secenv/error.h"

namespace {

void ReadFromUrandom(std::span<uint8_t> out) {
  std::ifstream urandom("/dev/urandom", std::ios::in | std::ios::binary);
  if (!urandom) {
    throw secenv::Error(secenv::ErrorDomain::Crypto, secenv::errors::crypto::kProviderFailure,
                        "Failed to open /dev/urandom", errno);
  }
  urandom.read(reinterpret_cast<char*>(out.data()),
               static_cast<std::streamsize>(out.size()));
  if (urandom.gcount() != static_cast<std::streamsize>(out.size())) {
    throw secenv::Error(secenv::ErrorDomain::Crypto, secenv::errors::crypto::kProviderFailure,
                        "Failed to read sufficient entropy from /dev/urandom", errno);
  }
}

}  // namespace

namespace secenv::crypto {

void SystemRandomBytes(std::span<uint8_t> out) {
  if (out.empty()) {
    return;
  }
#if defined(_WIN32)
  NTSTATUS status = BCryptGenRandom(nullptr, reinterpret_cast<PUCHAR>(out.data()),
                                    static_cast<ULONG>(out.size()),
                                    BCRYPT_USE_SYSTEM_PREFERRED_RNG);
  if (!BCRYPT_SUCCESS(status)) {
    throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "Windows RNG failed",
                static_cast<int>(status));
  }
#elif defined(__APPLE__) || defined(__FreeBSD__) || defined(__OpenBSD__) || defined(__NetBSD__)
  arc4random_buf(out.data(), out.size());
#elif defined(__linux__) || defined(__ANDROID__)
  size_t offset = 0;
  while (offset < out.size()) {
    ssize_t result = ::getrandom(out.data() + offset, out.size() - offset, 0);
    if (result < 0) {
      if (errno == EINTR) {
        continue;
      }
      if (errno == ENOSYS) {
        break; // kernels without getrandom(2)
      }
      throw Error(ErrorDomain::Crypto, errors::crypto::kProviderFailure, "getrandom failed", errno);
    }
    if (result == 0) {
      break;
    }
    offset += static_cast<size_t>(result);
  }
  if (offset < out.size()) {
    ReadFromUrandom(out.subspan(offset));
  }
#else
  ReadFromUrandom(out);
#endif
}

}  // namespace secenv::crypto
