#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "secenv/core/container.h"
#include "secenv/core/kdf.h"
#include "secenv/core/project.h"
#include "secenv/orchestrator/io_util.h"
#include "secenv/orchestrator/key_resolver.h"
#include "secenv/orchestrator/remote_store.h"

namespace secenv::orchestrator {

// Composes key resolution, derivation, encryption and the container codec
// into the user-facing operations. Holds no state between calls; the project
// identity is recomputed from the project root on every operation.
class BackupManager {
public:
  struct Options {
    std::filesystem::path project_root;
    std::filesystem::path storage_root;
    core::KdfParams kdf{};
    AtomicReplaceHooks container_write_hooks{};
  };

  struct BackupSummary {
    std::string project;
    std::vector<std::string> files;
    std::filesystem::path container_path;
    std::string timestamp;
  };

  struct RestoreSummary {
    std::string project;
    std::vector<std::string> files;
    std::string source; // container path, import path or remote path
  };

  struct ExportSummary {
    std::string project;
    std::filesystem::path destination;
    std::size_t bytes{0};
    bool key_verified{false};
  };

  struct PushSummary {
    BackupSummary backup;
    std::string remote_path;
    std::string revision;
    bool created{false}; // no remote object existed before
  };

  struct BackupInfo {
    std::string project;
    std::string hash;
    std::string timestamp;
    std::vector<std::string> files;
    std::filesystem::path container_path;
  };

  explicit BackupManager(Options options, std::shared_ptr<RemoteStore> remote = nullptr);

  void SetRemoteStore(std::shared_ptr<RemoteStore> remote);

  core::ProjectIdentity Identity() const;
  std::filesystem::path ContainerPath() const;

  // Encrypts every eligible env file into the local container. Throws
  // Error{Validation, kNoFilesFound} when there is nothing to back up.
  BackupSummary Backup(const KeyOptions& key);

  // Decrypts every entry of the local container, then writes the files.
  // Nothing is written if any entry fails to decrypt.
  RestoreSummary Restore(const KeyOptions& key);

  // Byte-identical copy of the local container. When a key is given, the
  // first entry must decrypt before anything is copied.
  ExportSummary Export(const std::filesystem::path& destination, const KeyOptions& key = {});

  // Stores a copy of |source| as the local container, then restores from it.
  RestoreSummary Import(const std::filesystem::path& source, const KeyOptions& key);

  // Backup followed by a conditional upload to <project>/backup.secenv.
  PushSummary Push(const KeyOptions& key);

  // Downloads <project>/backup.secenv, stores it locally and restores it.
  RestoreSummary Pull(const KeyOptions& key);

  bool HasBackup() const;

  // Metadata of the local container without decrypting; nullopt if absent.
  std::optional<BackupInfo> Info() const;

private:
  // Backup without the operation_failed event; Push reports its own failure.
  BackupSummary WriteBackup(const KeyOptions& key);
  std::vector<uint8_t> ReadLocalContainer(const core::ProjectIdentity& identity) const;
  void WriteLocalContainer(const core::ProjectIdentity& identity, std::span<const uint8_t> bytes);
  std::vector<std::string> RestoreRecord(const core::BackupRecord& record, const core::KeyMaterial& material,
                                         const core::ProjectIdentity& identity);
  RemoteStore& RequireRemote() const;

  Options options_;
  std::shared_ptr<RemoteStore> remote_;
};

}  // namespace secenv::orchestrator
