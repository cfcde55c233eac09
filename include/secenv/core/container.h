#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "secenv/core/cipher.h"

namespace secenv::core {

inline constexpr std::array<char, 8> kContainerMagic = {'S', 'E', 'C', 'E', 'N', 'V', '0', '1'};
inline constexpr std::size_t kContainerHeaderSize = kContainerMagic.size() + sizeof(uint32_t);

// Format obfuscation, not encryption. Reversible without key material so the
// payload never shows plain JSON to casual inspection. Confidentiality comes
// from the per-file AES-GCM layer only.
inline constexpr std::string_view kObfuscationKey = "SecuredEnvObfuscation2024";

// One project's snapshot.
struct BackupRecord {
  std::string project;
  std::string hash;      // empty for containers written without one
  std::string timestamp; // ISO-8601 UTC, millisecond precision
  std::map<std::string, EncryptedBlob> files;

  bool operator==(const BackupRecord&) const = default;
};

// magic(8) | payload length (u32 big-endian) | XOR(JSON payload)
std::vector<uint8_t> Serialize(const BackupRecord& record);

// Throws FormatError on short input, bad magic, length mismatch, unreadable
// payload or an entry name that is not a bare file name.
BackupRecord Deserialize(std::span<const uint8_t> bytes);

// XOR with the cycled obfuscation key. Self-inverse.
void ObfuscateInPlace(std::span<uint8_t> payload) noexcept;

// Bare file name that may be written inside the project root.
bool IsValidEntryName(std::string_view name);

std::string FormatTimestamp(std::chrono::system_clock::time_point tp);

}  // namespace secenv::core
