#pragma once
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace secenv {
  enum class ErrorDomain : std::uint16_t {
    Security = 0x01,
    IO = 0x02,
    Crypto = 0x03,
    Validation = 0x04,
    Config = 0x05,
    Remote = 0x06,
    State = 0x07,
    Internal = 0x7F
  };

  // Each domain reserves a span of codes to avoid collisions with propagated
  // platform error numbers. Codes inside the reserved range are stable across
  // releases.
  inline constexpr int kErrorDomainSpan = 0x0100;

  inline constexpr int ErrorDomainBase(ErrorDomain domain) {
    switch (domain) {
    case ErrorDomain::Security:
      return 0x0100;
    case ErrorDomain::IO:
      return 0x0200;
    case ErrorDomain::Crypto:
      return 0x0300;
    case ErrorDomain::Validation:
      return 0x0400;
    case ErrorDomain::Config:
      return 0x0500;
    case ErrorDomain::Remote:
      return 0x0600;
    case ErrorDomain::State:
      return 0x0700;
    case ErrorDomain::Internal:
      return 0x7F00;
    }
    return 0; // unreachable but placates compilers without warnings enabled
  }

  inline constexpr int ErrorDomainMax(ErrorDomain domain) {
    return ErrorDomainBase(domain) + kErrorDomainSpan - 1;
  }

  inline constexpr bool IsFrameworkErrorCode(ErrorDomain domain, int code) {
    return code >= ErrorDomainBase(domain) && code <= ErrorDomainMax(domain);
  }

  enum class Retryability : std::uint8_t {
    kFatal = 0,
    kTransient,
    kRetryable
  };

  namespace errors {
    inline constexpr int Make(ErrorDomain domain, int offset) {
      return ErrorDomainBase(domain) + offset;
    }

    namespace security {
      inline constexpr int kWeakKey = Make(ErrorDomain::Security, 0x01);
    } // namespace security

    namespace io {
      inline constexpr int kBackupNotFound = Make(ErrorDomain::IO, 0x01);
      inline constexpr int kReadFailed = Make(ErrorDomain::IO, 0x02);
      inline constexpr int kWriteFailed = Make(ErrorDomain::IO, 0x03);
      inline constexpr int kDirectoryFailed = Make(ErrorDomain::IO, 0x04);
      inline constexpr int kSourceMissing = Make(ErrorDomain::IO, 0x05);
    } // namespace io

    namespace crypto {
      inline constexpr int kDecryptionFailure = Make(ErrorDomain::Crypto, 0x01);
      inline constexpr int kProviderFailure = Make(ErrorDomain::Crypto, 0x02);
    } // namespace crypto

    namespace validation {
      inline constexpr int kContainerFormat = Make(ErrorDomain::Validation, 0x01);
      inline constexpr int kNoFilesFound = Make(ErrorDomain::Validation, 0x02);
      inline constexpr int kProjectMismatch = Make(ErrorDomain::Validation, 0x03);
      inline constexpr int kInvalidProject = Make(ErrorDomain::Validation, 0x04);
      inline constexpr int kInvalidFileName = Make(ErrorDomain::Validation, 0x05);
    } // namespace validation

    namespace config {
      inline constexpr int kKeyConflict = Make(ErrorDomain::Config, 0x01);
      inline constexpr int kKeyUnreadable = Make(ErrorDomain::Config, 0x02);
      inline constexpr int kKeyMissing = Make(ErrorDomain::Config, 0x03);
      inline constexpr int kRemoteNotConfigured = Make(ErrorDomain::Config, 0x04);
      inline constexpr int kConfigMalformed = Make(ErrorDomain::Config, 0x05);
      inline constexpr int kKdfParams = Make(ErrorDomain::Config, 0x06);
    } // namespace config

    namespace remote {
      inline constexpr int kRemoteNotFound = Make(ErrorDomain::Remote, 0x01);
      inline constexpr int kRemoteConflict = Make(ErrorDomain::Remote, 0x02);
      inline constexpr int kTransportFailed = Make(ErrorDomain::Remote, 0x03);
      inline constexpr int kUnexpectedResponse = Make(ErrorDomain::Remote, 0x04);
    } // namespace remote

  } // namespace errors

  struct Error : public std::runtime_error {
    ErrorDomain domain;
    int code;
    std::optional<int> native_code;
    Retryability retryability{Retryability::kFatal};
    std::vector<std::string> context;
    explicit Error(ErrorDomain d, int c, std::string msg,
                   std::optional<int> native = std::nullopt,
                   Retryability retry = Retryability::kFatal,
                   std::vector<std::string> ctx = {})
        : std::runtime_error(std::move(msg)),
          domain(d),
          code(c),
          native_code(native),
          retryability(retry),
          context(std::move(ctx)) {}
  };

  // Authentication tag mismatch, wrong key or tampered ciphertext. Never
  // accompanied by partial plaintext.
  struct DecryptionFailureError : public Error {
    explicit DecryptionFailureError(std::string msg)
        : Error(ErrorDomain::Crypto, errors::crypto::kDecryptionFailure, std::move(msg)) {}
  };

  // Bytes that are not a well-formed container. Kept distinct from
  // DecryptionFailureError so callers can tell "wrong file" from "wrong key".
  struct FormatError : public Error {
    explicit FormatError(std::string msg)
        : Error(ErrorDomain::Validation, errors::validation::kContainerFormat, std::move(msg)) {}
  };

  enum class KeyConfigReason : std::uint8_t {
    kMutuallyExclusive,
    kUnreadable,
    kMissing
  };

  struct KeyConfigError : public Error {
    KeyConfigReason reason;
    KeyConfigError(KeyConfigReason r, int c, std::string msg,
                   std::optional<int> native = std::nullopt)
        : Error(ErrorDomain::Config, c, std::move(msg), native), reason(r) {}
  };
} // namespace secenv
