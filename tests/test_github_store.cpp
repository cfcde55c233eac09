#include "secenv/common.h"
#include "secenv/error.h"
#include "secenv/platform/github_store.h"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

#include "test_support.h"

namespace {

using secenv::platform::GitHubRemoteStore;
using secenv::platform::HttpRequest;
using secenv::platform::HttpResponse;

secenv::orchestrator::RemoteConfig Config() {
  secenv::orchestrator::RemoteConfig config;
  config.token = "ghp_test";
  config.repo = "octo/env-backups";
  config.api_base = "https://github.example/api/";
  return config;
}

// Records requests and answers with queued responses.
struct FakeTransport {
  std::vector<HttpRequest> requests;
  std::vector<HttpResponse> responses;

  secenv::platform::HttpTransport Bind() {
    return [this](const HttpRequest& request) {
      requests.push_back(request);
      assert(!responses.empty());
      auto response = responses.front();
      responses.erase(responses.begin());
      return response;
    };
  }
};

std::string Header(const HttpRequest& request, const std::string& name) {
  for (const auto& [key, value] : request.headers) {
    if (key == name) {
      return value;
    }
  }
  return {};
}

void TestBase64() {
  using secenv::platform::DecodeBase64;
  using secenv::platform::EncodeBase64;
  assert(EncodeBase64(secenv::AsBytes("")).empty());
  assert(EncodeBase64(secenv::AsBytes("f")) == "Zg==");
  assert(EncodeBase64(secenv::AsBytes("fo")) == "Zm8=");
  assert(EncodeBase64(secenv::AsBytes("foo")) == "Zm9v");
  assert(EncodeBase64(secenv::AsBytes("foobar")) == "Zm9vYmFy");

  auto decoded = DecodeBase64("Zm9v\nYmE=\n");
  assert(decoded && std::string(decoded->begin(), decoded->end()) == "fooba");
  decoded = DecodeBase64("Zg==");
  assert(decoded && decoded->size() == 1 && (*decoded)[0] == 'f');
  assert(!DecodeBase64("Zm9").has_value());
  assert(!DecodeBase64("Zm9v!!!!").has_value());
}

void TestGetBlob() {
  FakeTransport transport;
  GitHubRemoteStore store(Config(), transport.Bind());
  assert(store.ContentsUrl("my app/backup.secenv") ==
         "https://github.example/api/repos/octo/env-backups/contents/my%20app/backup.secenv");

  nlohmann::json file = {{"type", "file"}, {"sha", "abc123"}, {"content", "U0VD\nRU5W\n"}};
  transport.responses.push_back({200, file.dump()});
  auto blob = store.GetBlob("my-app/backup.secenv");
  assert(blob.has_value());
  assert(std::string(blob->bytes.begin(), blob->bytes.end()) == "SECENV");
  assert(blob->revision == "abc123");

  const auto& request = transport.requests.back();
  assert(request.method == "GET");
  assert(request.url == "https://github.example/api/repos/octo/env-backups/contents/my-app/backup.secenv");
  assert(Header(request, "Authorization") == "token ghp_test");
  assert(Header(request, "User-Agent") == "SecuredEnv/1.0.0");
  assert(Header(request, "Accept") == "application/vnd.github.v3+json");

  transport.responses.push_back({404, R"({"message":"Not Found"})"});
  assert(!store.GetBlob("my-app/backup.secenv").has_value());

  transport.responses.push_back({200, R"([{"type":"file","name":"backup.secenv"}])"});
  assert(!store.GetBlob("my-app").has_value());

  transport.responses.push_back({200, R"({"type":"dir","sha":"d"})"});
  assert(!store.GetBlob("my-app").has_value());

  transport.responses.push_back({401, R"({"message":"Bad credentials"})"});
  bool raised = false;
  try {
    (void)store.GetBlob("my-app/backup.secenv");
  } catch (const secenv::Error& err) {
    raised = true;
    assert(err.domain == secenv::ErrorDomain::Remote);
    assert(err.code == secenv::errors::remote::kUnexpectedResponse);
    assert(err.native_code == 401);
  }
  assert(raised);
}

void TestPutBlob() {
  FakeTransport transport;
  GitHubRemoteStore store(Config(), transport.Bind());
  const std::vector<uint8_t> bytes{'S', 'E', 'C', 'E', 'N', 'V'};

  transport.responses.push_back({201, R"({"content":{"sha":"new-sha"},"commit":{"sha":"c"}})"});
  assert(store.PutBlob("my-app/backup.secenv", bytes, std::nullopt) == "new-sha");
  auto body = nlohmann::json::parse(transport.requests.back().body);
  assert(transport.requests.back().method == "PUT");
  assert(body["message"] == "Update environment backup for my-app");
  assert(body["content"] == "U0VDRU5W");
  assert(!body.contains("sha"));

  transport.responses.push_back({200, R"({"content":{"sha":"next-sha"}})"});
  assert(store.PutBlob("my-app/backup.secenv", bytes, std::string("new-sha")) == "next-sha");
  body = nlohmann::json::parse(transport.requests.back().body);
  assert(body["sha"] == "new-sha");

  for (long status : {409L, 422L}) {
    transport.responses.push_back({status, R"({"message":"sha does not match"})"});
    bool conflict = false;
    try {
      (void)store.PutBlob("my-app/backup.secenv", bytes, std::string("stale"));
    } catch (const secenv::Error& err) {
      conflict = err.code == secenv::errors::remote::kRemoteConflict;
    }
    assert(conflict);
  }

  transport.responses.push_back({500, "oops"});
  assert(secenv::testing::Throws<secenv::Error>(
      [&] { (void)store.PutBlob("my-app/backup.secenv", bytes, std::nullopt); }));
}

void TestIncompleteConfigRejected() {
  auto config = Config();
  config.token.clear();
  FakeTransport transport;
  assert(secenv::testing::Throws<secenv::Error>([&] { GitHubRemoteStore store(config, transport.Bind()); }));
}

} // namespace

int main() {
  TestBase64();
  TestGetBlob();
  TestPutBlob();
  TestIncompleteConfigRejected();
  std::cout << "github store tests ok\n";
  return 0;
}
