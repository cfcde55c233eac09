#include "secenv/orchestrator/config_store.h"

#include <nlohmann/json.hpp>

#include "secenv/common.h"
#include "secenv/error.h"
#include "secenv/errors.h"
#include "secenv/orchestrator/io_util.h"

namespace secenv::orchestrator {
namespace {

using nlohmann::json;

json ReadDocument(const std::filesystem::path& path) {
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    return json::object();
  }
  auto bytes = ReadFileBytes(path);
  try {
    auto doc = json::parse(bytes.begin(), bytes.end());
    if (!doc.is_object()) {
      throw Error(ErrorDomain::Config, errors::config::kConfigMalformed,
                  std::string(errors::msg::kConfigMalformed) + ": " + PathToUtf8String(path));
    }
    return doc;
  } catch (const json::exception& ex) {
    throw Error(ErrorDomain::Config, errors::config::kConfigMalformed,
                std::string(errors::msg::kConfigMalformed) + ": " + PathToUtf8String(path) + ": " +
                    ex.what());
  }
}

std::string StringField(const json& obj, const char* key) {
  auto it = obj.find(key);
  if (it == obj.end() || !it->is_string()) {
    return {};
  }
  return it->get<std::string>();
}

}  // namespace

ConfigStore::ConfigStore(std::filesystem::path storage_root)
    : path_(std::move(storage_root) / "config" / "config.json") {}

std::optional<RemoteConfig> ConfigStore::LoadRemote() const {
  const auto doc = ReadDocument(path_);
  auto it = doc.find("github");
  if (it == doc.end() || !it->is_object()) {
    return std::nullopt;
  }
  RemoteConfig config;
  config.token = StringField(*it, "token");
  config.repo = StringField(*it, "repo");
  if (auto base = StringField(*it, "apiBase"); !base.empty()) {
    config.api_base = base;
  }
  return config;
}

void ConfigStore::SaveRemote(const std::optional<std::string>& token,
                             const std::optional<std::string>& repo,
                             const std::optional<std::string>& api_base) {
  auto doc = ReadDocument(path_);
  auto& github = doc["github"];
  if (!github.is_object()) {
    github = json::object();
  }
  if (token) {
    github["token"] = *token;
  }
  if (repo) {
    github["repo"] = *repo;
  }
  if (api_base) {
    github["apiBase"] = *api_base;
  }
  EnsurePrivateDirectory(path_.parent_path());
  const std::string text = doc.dump(2);
  AtomicReplace(path_, AsBytes(text));
}

std::optional<RemoteConfig> ConfigStore::EffectiveRemote(const EnvLookup& env) const {
  RemoteConfig config = LoadRemote().value_or(RemoteConfig{});
  if (auto token = env("SECENV_GITHUB_TOKEN")) {
    config.token = *token;
  }
  if (auto repo = env("SECENV_GITHUB_REPO")) {
    config.repo = *repo;
  }
  if (!config.Complete()) {
    return std::nullopt;
  }
  return config;
}

}  // namespace secenv::orchestrator
