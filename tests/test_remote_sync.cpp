#include "secenv/error.h"
#include "secenv/orchestrator/backup_manager.h"
#include "secenv/orchestrator/event_bus.h"

#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "memory_remote_store.h"
#include "test_support.h"

namespace {

using secenv::orchestrator::BackupManager;
using secenv::orchestrator::KeyOptions;

constexpr char kPassword[] = "Str0ng!Pass99";
constexpr char kRemotePath[] = "sync-app/backup.secenv";

BackupManager MakeManager(const std::filesystem::path& machine, std::shared_ptr<secenv::orchestrator::RemoteStore> remote) {
  BackupManager::Options options;
  options.project_root = machine / "sync-app";
  options.storage_root = machine / "storage";
  std::filesystem::create_directories(options.project_root);
  return BackupManager(options, std::move(remote));
}

template <typename Fn>
int ErrorCode(Fn&& fn) {
  try {
    fn();
  } catch (const secenv::Error& err) {
    return err.code;
  }
  return 0;
}

void TestMemoryStoreSemantics() {
  secenv::testing::MemoryRemoteStore store;
  const std::vector<uint8_t> v1{1};
  assert(!store.GetBlob("p/x").has_value());
  auto r1 = store.PutBlob("p/x", v1, std::nullopt);
  assert(ErrorCode([&] { (void)store.PutBlob("p/x", v1, std::nullopt); }) == secenv::errors::remote::kRemoteConflict);
  auto r2 = store.PutBlob("p/x", v1, r1);
  assert(r2 != r1);
  assert(ErrorCode([&] { (void)store.PutBlob("p/x", v1, r1); }) == secenv::errors::remote::kRemoteConflict);
}

void TestPushThenPullOnAnotherMachine() {
  auto remote = std::make_shared<secenv::testing::MemoryRemoteStore>();
  secenv::testing::TempDir laptop("secenv_sync_laptop_");
  secenv::testing::TempDir desktop("secenv_sync_desktop_");

  auto first = MakeManager(laptop.path(), remote);
  secenv::testing::WriteText(laptop.path() / "sync-app" / ".env", "A=1");
  auto pushed = first.Push(KeyOptions::WithPassword(kPassword));
  assert(pushed.created);
  assert(pushed.remote_path == kRemotePath);
  assert(remote->Contains(kRemotePath));
  assert(remote->At(kRemotePath).revision == pushed.revision);
  assert(remote->At(kRemotePath).bytes == secenv::testing::ReadBytes(first.ContainerPath()));

  secenv::testing::WriteText(laptop.path() / "sync-app" / ".env", "A=2");
  auto repushed = first.Push(KeyOptions::WithPassword(kPassword));
  assert(!repushed.created);
  assert(repushed.revision != pushed.revision);

  auto second = MakeManager(desktop.path(), remote);
  auto pulled = second.Pull(KeyOptions::WithPassword(kPassword));
  assert(pulled.source == kRemotePath);
  assert((pulled.files == std::vector<std::string>{".env"}));
  assert(secenv::testing::ReadText(desktop.path() / "sync-app" / ".env") == "A=2");
  assert(secenv::testing::ReadBytes(second.ContainerPath()) == remote->At(kRemotePath).bytes);
}

void TestConcurrentPushConflicts() {
  auto remote = std::make_shared<secenv::testing::MemoryRemoteStore>();
  secenv::testing::TempDir machine("secenv_sync_conflict_");
  auto manager = MakeManager(machine.path(), remote);
  secenv::testing::WriteText(machine.path() / "sync-app" / ".env", "A=1");

  const auto original = remote->Overwrite(kRemotePath, {0x01, 0x02});
  // Another client lands a write between our read and our conditional write.
  remote->after_get = [&remote](const std::string& path) { (void)remote->Overwrite(path, {0x03}); };
  assert(ErrorCode([&] { (void)manager.Push(KeyOptions::WithPassword(kPassword)); }) ==
         secenv::errors::remote::kRemoteConflict);
  assert(remote->At(kRemotePath).bytes == std::vector<uint8_t>({0x03}));
  assert(remote->At(kRemotePath).revision != original);
}

void TestRemoteErrors() {
  secenv::testing::TempDir machine("secenv_sync_errors_");
  auto unconfigured = MakeManager(machine.path(), nullptr);
  secenv::testing::WriteText(machine.path() / "sync-app" / ".env", "A=1");
  assert(ErrorCode([&] { (void)unconfigured.Push(KeyOptions::WithPassword(kPassword)); }) ==
         secenv::errors::config::kRemoteNotConfigured);
  assert(ErrorCode([&] { (void)unconfigured.Pull(KeyOptions::WithPassword(kPassword)); }) ==
         secenv::errors::config::kRemoteNotConfigured);
  assert(!unconfigured.HasBackup());

  auto remote = std::make_shared<secenv::testing::MemoryRemoteStore>();
  unconfigured.SetRemoteStore(remote);
  assert(ErrorCode([&] { (void)unconfigured.Pull(KeyOptions::WithPassword(kPassword)); }) ==
         secenv::errors::remote::kRemoteNotFound);

  (void)remote->Overwrite(kRemotePath, {'n', 'o', 'p', 'e'});
  assert(secenv::testing::Throws<secenv::FormatError>(
      [&] { (void)unconfigured.Pull(KeyOptions::WithPassword(kPassword)); }));
  assert(!unconfigured.HasBackup());
}

void TestFailedPushReportsOnce() {
  secenv::orchestrator::ResetEventBusForTesting();
  std::vector<std::string> failed_operations;
  secenv::orchestrator::EventBus::Instance().Subscribe([&](const secenv::orchestrator::Event& e) {
    if (e.event_id != "operation_failed") {
      return;
    }
    for (const auto& field : e.fields) {
      if (field.key == "operation") {
        failed_operations.push_back(field.value);
      }
    }
  });

  secenv::testing::TempDir machine("secenv_sync_events_");
  auto manager = MakeManager(machine.path(), std::make_shared<secenv::testing::MemoryRemoteStore>());
  assert(ErrorCode([&] { (void)manager.Push(KeyOptions::WithPassword(kPassword)); }) ==
         secenv::errors::validation::kNoFilesFound);
  assert((failed_operations == std::vector<std::string>{"push"}));
  secenv::orchestrator::ResetEventBusForTesting();
}

} // namespace

int main() {
  TestMemoryStoreSemantics();
  TestRemoteErrors();
  TestFailedPushReportsOnce();
  TestPushThenPullOnAnotherMachine();
  TestConcurrentPushConflicts();
  std::cout << "remote sync tests ok\n";
  return 0;
}
