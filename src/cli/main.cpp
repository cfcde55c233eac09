#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "secenv/cli/command_line.h"
#include "secenv/common.h"
#include "secenv/core/key_validator.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/orchestrator/backup_manager.h"
#include "secenv/orchestrator/config_store.h"
#include "secenv/orchestrator/event_bus.h"
#include "secenv/orchestrator/storage_locator.h"
#include "secenv/platform/github_store.h"
#include "secenv/security/zeroizer.h"

namespace {

  using secenv::cli::CommandArgs;
  using secenv::cli::kExitAuth;
  using secenv::cli::kExitIO;
  using secenv::cli::kExitOk;
  using secenv::cli::kExitUsage;

  void PrintUsage() {
    std::cerr << "SecuredEnv - encrypted backups of .env files\n";
    std::cerr << "Usage:\n";
    std::cerr << "  secenv backup  (--key <password> | --key-file <path>)\n";
    std::cerr << "  secenv restore (--key <password> | --key-file <path>)\n";
    std::cerr << "  secenv push    (--key <password> | --key-file <path>)\n";
    std::cerr << "  secenv pull    (--key <password> | --key-file <path>)\n";
    std::cerr << "  secenv export  --output <file> [--key <password> | --key-file <path>]\n";
    std::cerr << "  secenv import  <file> (--key <password> | --key-file <path>)\n";
    std::cerr << "  secenv info\n";
    std::cerr << "  secenv validate <password>\n";
    std::cerr << "  secenv config  [--github-token <token>] [--github-repo <owner/repo>]\n";
    std::cerr << "\nGlobal flags:\n";
    std::cerr << "  --project-root <dir>   Project directory (default: current directory)\n";
    std::cerr << "  --verbose              Log lifecycle events to stderr\n";
  }

  void ReportError(const secenv::Error& err) {
    std::cerr << secenv::cli::FormatErrorLine(err) << '\n';

    secenv::orchestrator::Event event;
    event.category = secenv::orchestrator::EventCategory::kDiagnostics;
    event.severity = secenv::orchestrator::EventSeverity::kError;
    event.event_id = "cli_error";
    event.message = err.what();
    event.fields.emplace_back("domain", std::string(secenv::cli::DomainPrefix(err.domain)));
    event.fields.emplace_back("code", std::to_string(err.code),
                              secenv::orchestrator::FieldPrivacy::kPublic, true);
    if (err.native_code.has_value()) {
      event.fields.emplace_back("native_code", std::to_string(*err.native_code),
                                secenv::orchestrator::FieldPrivacy::kPublic, true);
    }
    try {
      secenv::orchestrator::EventBus::Instance().Publish(event);
    } catch (const std::exception& publish_error) {
      std::clog << "{\"event\":\"eventbus_error\",\"message\":\"error report publish failed\",\"detail\":\""
                << publish_error.what() << "\"}" << std::endl;
    }
  }

  void PrintFiles(const std::vector<std::string>& files) {
    for (const auto& name : files) {
      std::cout << "  " << name << '\n';
    }
  }

  std::shared_ptr<secenv::orchestrator::RemoteStore>
  MakeRemote(const std::filesystem::path& storage_root) {
    secenv::orchestrator::ConfigStore config(storage_root);
    auto remote = config.EffectiveRemote();
    if (!remote) {
      return nullptr;
    }
    return std::make_shared<secenv::platform::GitHubRemoteStore>(std::move(*remote));
  }

  int HandleBackup(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    auto summary = manager.Backup(args.key);
    std::cout << "Backup completed for project '" << summary.project << "' ("
              << summary.files.size() << " files)\n";
    PrintFiles(summary.files);
    std::cout << "Stored: " << secenv::PathToUtf8String(summary.container_path) << std::endl;
    return kExitOk;
  }

  int HandleRestore(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    auto summary = manager.Restore(args.key);
    std::cout << "Restore completed for project '" << summary.project << "'\n";
    PrintFiles(summary.files);
    std::cout.flush();
    return kExitOk;
  }

  int HandleExport(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    if (!args.output) {
      PrintUsage();
      return kExitUsage;
    }
    auto summary = manager.Export(*args.output, args.key);
    std::cout << "Export completed for project '" << summary.project << "'\n";
    std::cout << "File: " << secenv::PathToUtf8String(summary.destination) << " (" << summary.bytes
              << " bytes" << (summary.key_verified ? ", key verified" : "") << ")\n";
    std::cout << "Copy this file to another machine and run 'secenv import'." << std::endl;
    return kExitOk;
  }

  int HandleImport(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    if (args.positional.size() != 1) {
      PrintUsage();
      return kExitUsage;
    }
    const std::filesystem::path source(args.positional.front());
    auto summary = manager.Import(source, args.key);
    std::cout << "Import completed for project '" << summary.project << "'\n";
    PrintFiles(summary.files);
    std::cout << "Stored: " << secenv::PathToUtf8String(manager.ContainerPath()) << '\n';
    std::cout << "Delete " << summary.source << " once it is no longer needed." << std::endl;
    return kExitOk;
  }

  int HandlePush(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    auto summary = manager.Push(args.key);
    std::cout << "Pushed project '" << summary.backup.project << "' to " << summary.remote_path
              << (summary.created ? " (new)" : "") << '\n';
    PrintFiles(summary.backup.files);
    std::cout << "Revision: " << summary.revision << std::endl;
    return kExitOk;
  }

  int HandlePull(secenv::orchestrator::BackupManager& manager, const CommandArgs& args) {
    auto summary = manager.Pull(args.key);
    std::cout << "Pulled project '" << summary.project << "' from " << summary.source << '\n';
    PrintFiles(summary.files);
    std::cout.flush();
    return kExitOk;
  }

  int HandleInfo(secenv::orchestrator::BackupManager& manager) {
    auto info = manager.Info();
    if (!info) {
      std::cout << secenv::errors::msg::kBackupNotFound << " '" << manager.Identity().name << "'"
                << std::endl;
      return kExitOk;
    }
    std::cout << "Project:   " << info->project << '\n';
    if (!info->hash.empty()) {
      std::cout << "Hash:      " << info->hash << '\n';
    }
    std::cout << "Timestamp: " << info->timestamp << '\n';
    std::cout << "Container: " << secenv::PathToUtf8String(info->container_path) << '\n';
    std::cout << "Files:     " << info->files.size() << '\n';
    PrintFiles(info->files);
    std::cout.flush();
    return kExitOk;
  }

  int HandleValidate(const CommandArgs& args) {
    if (args.positional.size() != 1) {
      PrintUsage();
      return kExitUsage;
    }
    std::string password = args.positional.front();
    secenv::security::Zeroizer::ScopeWiper<char> guard(password.data(), password.size());
    const auto strength = secenv::core::ValidatePassword(password);
    std::cout << strength.message << " (score " << strength.score << "/6)" << std::endl;
    return strength.strong ? kExitOk : kExitAuth;
  }

  int HandleConfig(const std::filesystem::path& storage_root, const CommandArgs& args) {
    secenv::orchestrator::ConfigStore config(storage_root);
    if (!args.github_token && !args.github_repo) {
      auto remote = config.LoadRemote();
      if (!remote) {
        std::cout << "No remote configured." << std::endl;
        return kExitOk;
      }
      std::cout << "GitHub repo:  " << (remote->repo.empty() ? "(unset)" : remote->repo) << '\n';
      std::cout << "GitHub token: " << (remote->token.empty() ? "(unset)" : "(set)") << '\n';
      std::cout << "API base:     " << remote->api_base << std::endl;
      return kExitOk;
    }
    config.SaveRemote(args.github_token, args.github_repo);
    std::cout << "Configuration saved to " << secenv::PathToUtf8String(config.Path()) << std::endl;
    return kExitOk;
  }

} // namespace

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      PrintUsage();
      return kExitUsage;
    }

    std::filesystem::path project_root = std::filesystem::current_path();
    int index = 1;
    for (; index < argc; ++index) {
      std::string_view arg = argv[index];
      if (arg.rfind("--", 0) != 0) {
        break;
      }
      if (arg == "--verbose") {
        secenv::orchestrator::DefaultJsonLogger().SetMinimumSeverity(
            secenv::orchestrator::EventSeverity::kInfo);
        continue;
      }
      if (arg == "--project-root" && index + 1 < argc) {
        project_root = std::filesystem::path(argv[++index]);
        continue;
      }
      if (arg.rfind("--project-root=", 0) == 0) {
        project_root = std::filesystem::path(arg.substr(std::string_view("--project-root=").size()));
        continue;
      }
      if (arg == "--help" || arg == "-h") {
        PrintUsage();
        return kExitOk;
      }
      PrintUsage();
      return kExitUsage;
    }
    if (index >= argc) {
      PrintUsage();
      return kExitUsage;
    }

    std::string_view cmd = argv[index++];
    CommandArgs args;
    std::string parse_error;
    if (!secenv::cli::ParseCommandArgs(argc, argv, index, args, parse_error)) {
      std::cerr << "Validation error: " << parse_error << std::endl;
      PrintUsage();
      return kExitUsage;
    }

    if (cmd == "validate") {
      return HandleValidate(args);
    }

    const auto storage_root = secenv::orchestrator::ResolveStorageRoot();
    if (cmd == "config") {
      return HandleConfig(storage_root, args);
    }

    secenv::orchestrator::BackupManager::Options options;
    options.project_root = project_root;
    options.storage_root = storage_root;
    secenv::orchestrator::BackupManager manager(options);

    if (cmd == "backup") {
      return HandleBackup(manager, args);
    }
    if (cmd == "restore") {
      return HandleRestore(manager, args);
    }
    if (cmd == "export") {
      return HandleExport(manager, args);
    }
    if (cmd == "import") {
      return HandleImport(manager, args);
    }
    if (cmd == "info") {
      return HandleInfo(manager);
    }
    if (cmd == "push" || cmd == "pull") {
      manager.SetRemoteStore(MakeRemote(storage_root));
      return cmd == "push" ? HandlePush(manager, args) : HandlePull(manager, args);
    }

    PrintUsage();
    return kExitUsage;
  } catch (const secenv::Error& err) {
    ReportError(err);
    return secenv::cli::ExitCodeFor(err);
  } catch (const std::exception& err) {
    std::cerr << "I/O error: " << err.what() << std::endl;
    return kExitIO;
  }
}
