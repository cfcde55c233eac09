#pragma once

#include <string_view>

namespace secenv::errors::msg {
// Centralized user-facing message catalog
inline constexpr std::string_view kWeakPassword{"Weak password"};
inline constexpr std::string_view kStrongPassword{"Strong password"};
inline constexpr std::string_view kKeyMutuallyExclusive{"Password and key file are mutually exclusive"};
inline constexpr std::string_view kKeyMissing{"Encryption key is required (password or key file)"};
inline constexpr std::string_view kKeyFileUnreadable{"Key file is unreadable"};
inline constexpr std::string_view kDecryptionFailed{"Decryption failed: wrong key or corrupted data"};
inline constexpr std::string_view kBlobMalformed{"Encrypted entry is malformed"};
inline constexpr std::string_view kContainerTooShort{"Invalid backup file format"};
inline constexpr std::string_view kContainerBadMagic{"Invalid backup file format - not a SecuredEnv file"};
inline constexpr std::string_view kContainerBadLength{"Corrupted backup file - invalid length"};
inline constexpr std::string_view kContainerPayloadInvalid{"Corrupted backup file - unreadable payload"};
inline constexpr std::string_view kContainerEntryNameInvalid{"Backup file contains an invalid entry name"};
inline constexpr std::string_view kContainerTooLarge{"Backup payload exceeds the container size limit"};
inline constexpr std::string_view kEnvFileNameNotUtf8{"Environment file name is not valid UTF-8"};
inline constexpr std::string_view kProjectNameNotUtf8{"Project directory name is not valid UTF-8"};
inline constexpr std::string_view kNoEnvFiles{"No environment files found in project directory"};
inline constexpr std::string_view kBackupNotFound{"No backup found for project"};
inline constexpr std::string_view kProjectMismatch{"Backup belongs to a different project"};
inline constexpr std::string_view kInvalidProjectRoot{"Unable to derive project name from directory"};
inline constexpr std::string_view kRemoteNotConfigured{"Remote repository not configured. Run: secenv config --github-token <token> --github-repo <owner/repo>"};
inline constexpr std::string_view kRemoteNotFound{"No remote backup found for project"};
inline constexpr std::string_view kRemoteConflict{"Remote backup changed concurrently; pull and retry"};
inline constexpr std::string_view kConfigMalformed{"Configuration file is malformed"};
inline constexpr std::string_view kKdfIterationsTooLow{"KDF iteration count below minimum"};
}  // namespace secenv::errors::msg
