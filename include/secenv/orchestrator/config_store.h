#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "secenv/orchestrator/storage_locator.h"

namespace secenv::orchestrator {

inline constexpr std::string_view kDefaultGitHubApiBase = "https://api.github.com";

struct RemoteConfig {
  std::string token;
  std::string repo; // owner/repo
  std::string api_base{kDefaultGitHubApiBase};

  bool Complete() const noexcept { return !token.empty() && !repo.empty(); }
};

// Persists settings as JSON at <storage-root>/config/config.json, mode 0600.
// Keys this version does not know about are preserved on save.
class ConfigStore {
public:
  explicit ConfigStore(std::filesystem::path storage_root);

  const std::filesystem::path& Path() const noexcept { return path_; }

  // Stored remote settings, or nullopt when none are stored. Throws
  // Error{Config, kConfigMalformed} on an unparseable file.
  std::optional<RemoteConfig> LoadRemote() const;

  // Updates the given fields and keeps the rest.
  void SaveRemote(const std::optional<std::string>& token,
                  const std::optional<std::string>& repo,
                  const std::optional<std::string>& api_base = std::nullopt);

  // Stored settings overlaid with SECENV_GITHUB_TOKEN and SECENV_GITHUB_REPO.
  // nullopt unless both token and repo end up set.
  std::optional<RemoteConfig> EffectiveRemote(const EnvLookup& env = ProcessEnv) const;

private:
  std::filesystem::path path_;
};

}  // namespace secenv::orchestrator
