#include "secenv/core/container.h"

#include <cstring>
#include <limits>
#include <sstream>

#include <nlohmann/json.hpp>

#include "secenv/common.h"
#include "secenv/error.h"
#include "secenv/errors.h"

namespace secenv::core {
namespace {

using nlohmann::json;

std::string Describe(std::string_view message, std::string_view detail) {
  std::string out(message);
  if (!detail.empty()) {
    out += ": ";
    out += detail;
  }
  return out;
}

template <size_t N>
std::array<uint8_t, N> DecodeFixed(const json& entry, const char* field, const std::string& name) {
  auto decoded = FromHex(entry.at(field).get<std::string>());
  if (!decoded || decoded->size() != N) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid,
                               "entry '" + name + "' has a malformed " + field));
  }
  std::array<uint8_t, N> out{};
  std::memcpy(out.data(), decoded->data(), N);
  return out;
}

EncryptedBlob BlobFromJson(const json& entry, const std::string& name) {
  if (!entry.is_object()) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid, "entry '" + name + "' is not an object"));
  }
  EncryptedBlob blob;
  auto ciphertext = FromHex(entry.at("encrypted").get<std::string>());
  if (!ciphertext) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid,
                               "entry '" + name + "' has malformed ciphertext"));
  }
  blob.ciphertext = std::move(*ciphertext);
  blob.salt = DecodeFixed<kSaltSize>(entry, "salt", name);
  blob.nonce = DecodeFixed<kNonceSize>(entry, "iv", name);
  blob.tag = DecodeFixed<kTagSize>(entry, "authTag", name);
  return blob;
}

json BlobToJson(const EncryptedBlob& blob) {
  return json{{"encrypted", ToHex(blob.ciphertext)},
              {"salt", ToHex(blob.salt)},
              {"iv", ToHex(blob.nonce)},
              {"authTag", ToHex(blob.tag)}};
}

BackupRecord RecordFromJson(const json& doc) {
  if (!doc.is_object()) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid, "payload is not an object"));
  }
  BackupRecord record;
  // Containers from the older command-line tool use projectName/environments
  // and nest each blob under "encrypted" next to size and line counts.
  const bool legacy = !doc.contains("files") && doc.contains("environments");
  record.project = doc.at(doc.contains("project") ? "project" : "projectName").get<std::string>();
  if (doc.contains("hash")) {
    record.hash = doc.at("hash").get<std::string>();
  }
  if (doc.contains("timestamp")) {
    record.timestamp = doc.at("timestamp").get<std::string>();
  }
  const auto& files = doc.at(legacy ? "environments" : "files");
  if (!files.is_object()) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid, "file table is not an object"));
  }
  for (const auto& [name, entry] : files.items()) {
    if (!IsValidEntryName(name)) {
      throw FormatError(Describe(errors::msg::kContainerEntryNameInvalid, name));
    }
    record.files.emplace(name, BlobFromJson(legacy ? entry.at("encrypted") : entry, name));
  }
  return record;
}

}  // namespace

void ObfuscateInPlace(std::span<uint8_t> payload) noexcept {
  for (size_t i = 0; i < payload.size(); ++i) {
    payload[i] ^= static_cast<uint8_t>(kObfuscationKey[i % kObfuscationKey.size()]);
  }
}

bool IsValidEntryName(std::string_view name) {
  if (name.empty() || name == "." || name == "..") {
    return false;
  }
  if (name.find_first_of("/\\") != std::string_view::npos || name.find('\0') != std::string_view::npos) {
    return false;
  }
  if (!IsValidUtf8(name)) {
    return false;
  }
  if (name.size() >= kContainerExtension.size() &&
      name.substr(name.size() - kContainerExtension.size()) == kContainerExtension) {
    return false;
  }
  return true;
}

std::string FormatTimestamp(std::chrono::system_clock::time_point tp) {
  return FormatUtcTimestamp(tp, TimestampPrecision::kMillis);
}

std::vector<uint8_t> Serialize(const BackupRecord& record) {
  json files = json::object();
  for (const auto& [name, blob] : record.files) {
    if (!IsValidEntryName(name)) {
      throw FormatError(Describe(errors::msg::kContainerEntryNameInvalid, name));
    }
    files[name] = BlobToJson(blob);
  }
  json doc{{"project", record.project}, {"timestamp", record.timestamp}, {"files", std::move(files)}};
  if (!record.hash.empty()) {
    doc["hash"] = record.hash;
  }
  std::string text;
  try {
    text = doc.dump();
  } catch (const json::exception& ex) {
    // Entry names are checked above; this catches a project name that is not UTF-8.
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid,
                               "project '" + ToHex(AsBytes(record.project)) + "' is not encodable: " + ex.what()));
  }
  if (text.size() > std::numeric_limits<uint32_t>::max()) {
    throw FormatError(std::string(errors::msg::kContainerTooLarge));
  }

  std::vector<uint8_t> out;
  out.reserve(kContainerHeaderSize + text.size());
  out.insert(out.end(), kContainerMagic.begin(), kContainerMagic.end());
  const uint32_t length_be = ToBigEndian32(static_cast<uint32_t>(text.size()));
  const auto* length_bytes = reinterpret_cast<const uint8_t*>(&length_be);
  out.insert(out.end(), length_bytes, length_bytes + sizeof(length_be));
  out.insert(out.end(), text.begin(), text.end());
  ObfuscateInPlace(std::span<uint8_t>(out.data() + kContainerHeaderSize, text.size()));
  return out;
}

BackupRecord Deserialize(std::span<const uint8_t> bytes) {
  if (bytes.size() < kContainerHeaderSize) {
    throw FormatError(std::string(errors::msg::kContainerTooShort));
  }
  if (std::memcmp(bytes.data(), kContainerMagic.data(), kContainerMagic.size()) != 0) {
    throw FormatError(std::string(errors::msg::kContainerBadMagic));
  }
  uint32_t length_be = 0;
  std::memcpy(&length_be, bytes.data() + kContainerMagic.size(), sizeof(length_be));
  const uint64_t declared = FromBigEndian32(length_be);
  if (declared != bytes.size() - kContainerHeaderSize) {
    throw FormatError(std::string(errors::msg::kContainerBadLength));
  }

  std::vector<uint8_t> payload(bytes.begin() + kContainerHeaderSize, bytes.end());
  ObfuscateInPlace(payload);
  try {
    return RecordFromJson(json::parse(payload.begin(), payload.end()));
  } catch (const json::exception& ex) {
    throw FormatError(Describe(errors::msg::kContainerPayloadInvalid, ex.what()));
  }
}

}  // namespace secenv::core
