#pragma once

#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace secenv::orchestrator {

using EnvLookup = std::function<std::optional<std::string>(std::string_view)>;

// Reads the process environment; empty values count as unset.
std::optional<std::string> ProcessEnv(std::string_view name);

// Root directory for local containers and configuration. SECENV_HOME wins,
// then the platform convention:
//   Linux    $XDG_CONFIG_HOME/securedenv or ~/.config/securedenv
//   macOS    ~/Library/Application Support/SecuredEnv
//   Windows  %APPDATA%\SecuredEnv
// Throws Error{Config} when no home directory can be determined.
std::filesystem::path ResolveStorageRoot(const EnvLookup& env = ProcessEnv);

}  // namespace secenv::orchestrator
