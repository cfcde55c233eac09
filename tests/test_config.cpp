#include "secenv/error.h"
#include "secenv/orchestrator/config_store.h"
#include "secenv/orchestrator/storage_locator.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <filesystem>
#include <iostream>
#include <map>
#include <optional>
#include <string>

#include "test_support.h"

namespace {

secenv::orchestrator::EnvLookup FakeEnv(std::map<std::string, std::string> values) {
  return [values = std::move(values)](std::string_view name) -> std::optional<std::string> {
    auto it = values.find(std::string(name));
    if (it == values.end()) {
      return std::nullopt;
    }
    return it->second;
  };
}

void TestStorageRootResolution() {
  using secenv::orchestrator::ResolveStorageRoot;
  assert(ResolveStorageRoot(FakeEnv({{"SECENV_HOME", "/srv/secenv"}, {"HOME", "/home/u"}})) ==
         std::filesystem::path("/srv/secenv"));
#if defined(__linux__)
  assert(ResolveStorageRoot(FakeEnv({{"XDG_CONFIG_HOME", "/cfg"}, {"HOME", "/home/u"}})) ==
         std::filesystem::path("/cfg/securedenv"));
  assert(ResolveStorageRoot(FakeEnv({{"HOME", "/home/u"}})) ==
         std::filesystem::path("/home/u/.config/securedenv"));
  assert(secenv::testing::Throws<secenv::Error>([] { (void)ResolveStorageRoot(FakeEnv({})); }));
#endif
}

void TestSaveAndLoad() {
  secenv::testing::TempDir temp("secenv_config_");
  secenv::orchestrator::ConfigStore store(temp.path());
  assert(store.Path() == temp.path() / "config" / "config.json");
  assert(!store.LoadRemote().has_value());

  store.SaveRemote(std::string("ghp_token"), std::string("octo/envs"));
  auto loaded = store.LoadRemote();
  assert(loaded.has_value());
  assert(loaded->token == "ghp_token");
  assert(loaded->repo == "octo/envs");
  assert(loaded->api_base == secenv::orchestrator::kDefaultGitHubApiBase);
  assert(loaded->Complete());

#if !defined(_WIN32)
  auto perms = std::filesystem::status(store.Path()).permissions();
  assert((perms & (std::filesystem::perms::group_all | std::filesystem::perms::others_all)) ==
         std::filesystem::perms::none);
#endif

  // Partial update keeps the other field.
  store.SaveRemote(std::nullopt, std::string("octo/other"));
  loaded = store.LoadRemote();
  assert(loaded->token == "ghp_token" && loaded->repo == "octo/other");
}

void TestUnknownKeysPreserved() {
  secenv::testing::TempDir temp("secenv_config_keys_");
  secenv::orchestrator::ConfigStore store(temp.path());
  std::filesystem::create_directories(store.Path().parent_path());
  secenv::testing::WriteText(store.Path(), R"({"github":{"token":"t","extra":1},"telemetry":false})");

  store.SaveRemote(std::nullopt, std::string("a/b"));
  auto doc = nlohmann::json::parse(secenv::testing::ReadText(store.Path()));
  assert(doc["telemetry"] == false);
  assert(doc["github"]["extra"] == 1);
  assert(doc["github"]["repo"] == "a/b");
  assert(doc["github"]["token"] == "t");
}

void TestEnvironmentOverrides() {
  secenv::testing::TempDir temp("secenv_config_env_");
  secenv::orchestrator::ConfigStore store(temp.path());
  assert(!store.EffectiveRemote(FakeEnv({})).has_value());

  store.SaveRemote(std::string("stored"), std::nullopt);
  assert(!store.EffectiveRemote(FakeEnv({})).has_value());

  auto effective = store.EffectiveRemote(FakeEnv({{"SECENV_GITHUB_REPO", "env/repo"}}));
  assert(effective && effective->token == "stored" && effective->repo == "env/repo");

  effective = store.EffectiveRemote(
      FakeEnv({{"SECENV_GITHUB_TOKEN", "env-token"}, {"SECENV_GITHUB_REPO", "env/repo"}}));
  assert(effective && effective->token == "env-token");
}

void TestMalformedConfig() {
  secenv::testing::TempDir temp("secenv_config_bad_");
  secenv::orchestrator::ConfigStore store(temp.path());
  std::filesystem::create_directories(store.Path().parent_path());
  secenv::testing::WriteText(store.Path(), "{not json");
  bool raised = false;
  try {
    (void)store.LoadRemote();
  } catch (const secenv::Error& err) {
    raised = true;
    assert(err.domain == secenv::ErrorDomain::Config);
    assert(err.code == secenv::errors::config::kConfigMalformed);
  }
  assert(raised);
}

} // namespace

int main() {
  TestStorageRootResolution();
  TestSaveAndLoad();
  TestUnknownKeysPreserved();
  TestEnvironmentOverrides();
  TestMalformedConfig();
  std::cout << "configuration tests ok\n";
  return 0;
}
