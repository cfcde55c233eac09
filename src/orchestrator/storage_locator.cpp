#include "secenv/orchestrator/storage_locator.h"

#include <cstdlib>

#include "secenv/error.h"

namespace secenv::orchestrator {
namespace {

std::filesystem::path HomeDirectory(const EnvLookup& env) {
#if defined(_WIN32)
  if (auto profile = env("USERPROFILE")) {
    return *profile;
  }
#endif
  if (auto home = env("HOME")) {
    return *home;
  }
  throw Error(ErrorDomain::Config, errors::config::kConfigMalformed,
              "Unable to determine home directory; set SECENV_HOME");
}

}  // namespace

std::optional<std::string> ProcessEnv(std::string_view name) {
  const std::string key(name);
  const char* value = std::getenv(key.c_str());
  if (!value || *value == '\0') {
    return std::nullopt;
  }
  return std::string(value);
}

std::filesystem::path ResolveStorageRoot(const EnvLookup& env) {
  if (auto overridden = env("SECENV_HOME")) {
    return *overridden;
  }
#if defined(_WIN32)
  if (auto appdata = env("APPDATA")) {
    return std::filesystem::path(*appdata) / "SecuredEnv";
  }
  return HomeDirectory(env) / "AppData" / "Roaming" / "SecuredEnv";
#elif defined(__APPLE__)
  return HomeDirectory(env) / "Library" / "Application Support" / "SecuredEnv";
#else
  if (auto config_home = env("XDG_CONFIG_HOME")) {
    return std::filesystem::path(*config_home) / "securedenv";
  }
  return HomeDirectory(env) / ".config" / "securedenv";
#endif
}

}  // namespace secenv::orchestrator
