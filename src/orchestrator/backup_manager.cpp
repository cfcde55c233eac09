#include "secenv/orchestrator/backup_manager.h"

#include <chrono>
#include <type_traits>
#include <utility>

#include "secenv/common.h"
#include "secenv/core/cipher.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/orchestrator/env_files.h"
#include "secenv/orchestrator/event_bus.h"
#include "secenv/security/secure_buffer.h"

namespace secenv::orchestrator {
namespace {

void PublishCompleted(const char* event_id, const std::string& message, const std::string& project,
                      std::size_t file_count, std::vector<EventField> extra = {}) {
  Event event;
  event.category = EventCategory::kLifecycle;
  event.severity = EventSeverity::kInfo;
  event.event_id = event_id;
  event.message = message;
  event.fields.emplace_back("project", project, FieldPrivacy::kHash);
  event.fields.emplace_back("file_count", std::to_string(file_count), FieldPrivacy::kPublic, true);
  for (auto& field : extra) {
    event.fields.push_back(std::move(field));
  }
  EventBus::Instance().Publish(event);
}

void PublishFailure(const char* operation, const std::exception& ex) {
  Event event;
  event.category = EventCategory::kDiagnostics;
  event.severity = EventSeverity::kError;
  event.event_id = "operation_failed";
  event.message = ex.what();
  event.fields.emplace_back("operation", operation);
  if (const auto* err = dynamic_cast<const Error*>(&ex)) {
    event.fields.emplace_back("code", std::to_string(err->code), FieldPrivacy::kPublic, true);
  }
  EventBus::Instance().Publish(event);
}

// Publishes operation_failed and rethrows.
template <typename Func>
auto Observed(const char* operation, Func&& fn) -> std::invoke_result_t<Func&> {
  try {
    return fn();
  } catch (const std::exception& ex) {
    PublishFailure(operation, ex);
    throw;
  }
}

std::vector<std::string> FileNames(const core::BackupRecord& record) {
  std::vector<std::string> names;
  names.reserve(record.files.size());
  for (const auto& [name, blob] : record.files) {
    names.push_back(name);
  }
  return names;
}

void CheckProject(const core::BackupRecord& record, const core::ProjectIdentity& identity) {
  if (!record.hash.empty() && record.hash != identity.hash) {
    throw Error(ErrorDomain::Validation, errors::validation::kProjectMismatch,
                std::string(errors::msg::kProjectMismatch) + ": backup is for '" + record.project +
                    "', current project is '" + identity.name + "'");
  }
}

}  // namespace

BackupManager::BackupManager(Options options, std::shared_ptr<RemoteStore> remote)
    : options_(std::move(options)), remote_(std::move(remote)) {}

void BackupManager::SetRemoteStore(std::shared_ptr<RemoteStore> remote) {
  remote_ = std::move(remote);
}

core::ProjectIdentity BackupManager::Identity() const {
  return core::Identify(options_.project_root);
}

std::filesystem::path BackupManager::ContainerPath() const {
  return core::StorageLayout(options_.storage_root).LocalContainerPath(Identity());
}

std::vector<uint8_t> BackupManager::ReadLocalContainer(const core::ProjectIdentity& identity) const {
  const auto path = core::StorageLayout(options_.storage_root).LocalContainerPath(identity);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    throw Error(ErrorDomain::IO, errors::io::kBackupNotFound,
                std::string(errors::msg::kBackupNotFound) + " '" + identity.name + "'");
  }
  return ReadFileBytes(path);
}

void BackupManager::WriteLocalContainer(const core::ProjectIdentity& identity,
                                        std::span<const uint8_t> bytes) {
  core::StorageLayout layout(options_.storage_root);
  EnsurePrivateDirectory(layout.ProjectDirectory(identity));
  AtomicReplace(layout.LocalContainerPath(identity), bytes, options_.container_write_hooks);
}

std::vector<std::string> BackupManager::RestoreRecord(const core::BackupRecord& record,
                                                      const core::KeyMaterial& material,
                                                      const core::ProjectIdentity& identity) {
  // Decrypt everything first so a wrong key leaves the working tree untouched.
  std::vector<std::pair<std::string, security::SecureBuffer<uint8_t>>> plaintexts;
  plaintexts.reserve(record.files.size());
  for (const auto& [name, blob] : record.files) {
    auto plain = core::Decrypt(blob, material, identity, options_.kdf);
    security::Zeroizer::ScopeWiper<uint8_t> guard(std::span<uint8_t>(plain.data(), plain.size()));
    plaintexts.emplace_back(name, security::SecureBuffer<uint8_t>(std::span<const uint8_t>(plain)));
  }

  std::vector<std::string> written;
  written.reserve(plaintexts.size());
  for (const auto& [name, plain] : plaintexts) {
    AtomicReplace(options_.project_root / name, plain.AsSpan());
    written.push_back(name);
  }
  return written;
}

BackupManager::BackupSummary BackupManager::WriteBackup(const KeyOptions& key) {
  const auto material = ResolveKey(key);
  const auto identity = Identity();
  const auto names = FindEnvFiles(options_.project_root);
  if (names.empty()) {
    throw Error(ErrorDomain::Validation, errors::validation::kNoFilesFound,
                std::string(errors::msg::kNoEnvFiles));
  }

  core::BackupRecord record;
  record.project = identity.name;
  record.hash = identity.hash;
  record.timestamp = core::FormatTimestamp(std::chrono::system_clock::now());
  for (const auto& name : names) {
    auto plain = ReadFileBytes(options_.project_root / name);
    security::Zeroizer::ScopeWiper<uint8_t> guard(std::span<uint8_t>(plain.data(), plain.size()));
    record.files.emplace(name, core::Encrypt(plain, material, identity, options_.kdf));
  }

  const auto bytes = core::Serialize(record);
  WriteLocalContainer(identity, bytes);

  BackupSummary summary;
  summary.project = identity.name;
  summary.files = names;
  summary.container_path = core::StorageLayout(options_.storage_root).LocalContainerPath(identity);
  summary.timestamp = record.timestamp;
  PublishCompleted("backup_completed", "Backup written", identity.name, names.size(),
                   {EventField("container", PathToUtf8String(summary.container_path), FieldPrivacy::kHash)});
  return summary;
}

BackupManager::BackupSummary BackupManager::Backup(const KeyOptions& key) {
  return Observed("backup", [&] { return WriteBackup(key); });
}

BackupManager::RestoreSummary BackupManager::Restore(const KeyOptions& key) {
  return Observed("restore", [&] {
    const auto material = ResolveKey(key);
    const auto identity = Identity();
    const auto bytes = ReadLocalContainer(identity);
    const auto record = core::Deserialize(bytes);
    CheckProject(record, identity);

    RestoreSummary summary;
    summary.project = identity.name;
    summary.files = RestoreRecord(record, material, identity);
    summary.source = PathToUtf8String(core::StorageLayout(options_.storage_root).LocalContainerPath(identity));
    PublishCompleted("restore_completed", "Restore finished", identity.name, summary.files.size());
    return summary;
  });
}

BackupManager::ExportSummary BackupManager::Export(const std::filesystem::path& destination,
                                                   const KeyOptions& key) {
  return Observed("export", [&] {
    const auto identity = Identity();
    const auto bytes = ReadLocalContainer(identity);
    const auto record = core::Deserialize(bytes);

    ExportSummary summary;
    summary.project = identity.name;
    summary.destination = destination;
    if (!key.Empty()) {
      const auto material = ResolveKey(key);
      if (!record.files.empty()) {
        auto plain = core::Decrypt(record.files.begin()->second, material, identity, options_.kdf);
        security::Zeroizer::WipeVector(plain);
        summary.key_verified = true;
      }
    }

    AtomicReplace(destination, bytes);
    summary.bytes = bytes.size();
    PublishCompleted("export_completed", "Container exported", identity.name, record.files.size(),
                     {EventField("verified", summary.key_verified ? "true" : "false", FieldPrivacy::kPublic, true)});
    return summary;
  });
}

BackupManager::RestoreSummary BackupManager::Import(const std::filesystem::path& source,
                                                    const KeyOptions& key) {
  return Observed("import", [&] {
    const auto material = ResolveKey(key);
    const auto identity = Identity();
    const auto bytes = ReadFileBytes(source);
    const auto record = core::Deserialize(bytes);
    CheckProject(record, identity);

    WriteLocalContainer(identity, bytes);

    RestoreSummary summary;
    summary.project = identity.name;
    summary.files = RestoreRecord(record, material, identity);
    summary.source = PathToUtf8String(source);
    PublishCompleted("import_completed", "Import finished", identity.name, summary.files.size());
    return summary;
  });
}

BackupManager::PushSummary BackupManager::Push(const KeyOptions& key) {
  return Observed("push", [&] {
    auto& remote = RequireRemote();

    PushSummary summary;
    summary.backup = WriteBackup(key);
    const auto identity = Identity();
    const auto bytes = ReadLocalContainer(identity);
    summary.remote_path = core::StorageLayout::RemotePath(identity);

    // Read-then-conditional-write; a concurrent push surfaces as kRemoteConflict.
    std::optional<std::string> expected;
    if (auto existing = remote.GetBlob(summary.remote_path)) {
      expected = std::move(existing->revision);
    }
    summary.created = !expected.has_value();
    summary.revision = remote.PutBlob(summary.remote_path, bytes, expected);
    PublishCompleted("push_completed", "Backup uploaded", identity.name, summary.backup.files.size(),
                     {EventField("revision", summary.revision)});
    return summary;
  });
}

BackupManager::RestoreSummary BackupManager::Pull(const KeyOptions& key) {
  return Observed("pull", [&] {
    auto& remote = RequireRemote();
    const auto material = ResolveKey(key);
    const auto identity = Identity();
    const auto remote_path = core::StorageLayout::RemotePath(identity);

    auto blob = remote.GetBlob(remote_path);
    if (!blob) {
      throw Error(ErrorDomain::Remote, errors::remote::kRemoteNotFound,
                  std::string(errors::msg::kRemoteNotFound) + " '" + identity.name + "'");
    }
    const auto record = core::Deserialize(blob->bytes);
    CheckProject(record, identity);

    WriteLocalContainer(identity, blob->bytes);

    RestoreSummary summary;
    summary.project = identity.name;
    summary.files = RestoreRecord(record, material, identity);
    summary.source = remote_path;
    PublishCompleted("pull_completed", "Backup downloaded", identity.name, summary.files.size(),
                     {EventField("revision", blob->revision)});
    return summary;
  });
}

bool BackupManager::HasBackup() const {
  std::error_code ec;
  return std::filesystem::is_regular_file(ContainerPath(), ec);
}

std::optional<BackupManager::BackupInfo> BackupManager::Info() const {
  const auto identity = Identity();
  const auto path = core::StorageLayout(options_.storage_root).LocalContainerPath(identity);
  std::error_code ec;
  if (!std::filesystem::is_regular_file(path, ec)) {
    return std::nullopt;
  }
  const auto record = core::Deserialize(ReadFileBytes(path));
  BackupInfo info;
  info.project = record.project;
  info.hash = record.hash;
  info.timestamp = record.timestamp;
  info.files = FileNames(record);
  info.container_path = path;
  return info;
}

RemoteStore& BackupManager::RequireRemote() const {
  if (!remote_) {
    throw Error(ErrorDomain::Config, errors::config::kRemoteNotConfigured,
                std::string(errors::msg::kRemoteNotConfigured));
  }
  return *remote_;
}

}  // namespace secenv::orchestrator
