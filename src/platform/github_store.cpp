#include "secenv/platform/github_store.h"

#include <openssl/evp.h>

#include <nlohmann/json.hpp>

#include <utility>

#include "secenv/error.h"
#include "secenv/errors.h"

namespace secenv::platform {
namespace {

using nlohmann::json;

constexpr long kHttpOk = 200;
constexpr long kHttpCreated = 201;
constexpr long kHttpNotFound = 404;
constexpr long kHttpConflict = 409;
constexpr long kHttpUnprocessable = 422;

[[noreturn]] void ThrowUnexpected(const std::string& what, long status) {
  throw Error(ErrorDomain::Remote, errors::remote::kUnexpectedResponse,
              "Unexpected response from GitHub " + what + " (HTTP " + std::to_string(status) + ")",
              static_cast<int>(status));
}

bool IsUnreserved(unsigned char c) {
  return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' ||
         c == '_' || c == '.' || c == '~';
}

// Percent-encodes each segment and keeps the '/' separators.
std::string EncodePath(std::string_view path) {
  static constexpr char kHex[] = "0123456789ABCDEF";
  std::string out;
  out.reserve(path.size());
  for (unsigned char c : path) {
    if (c == '/' || IsUnreserved(c)) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(kHex[c >> 4]);
      out.push_back(kHex[c & 0x0F]);
    }
  }
  return out;
}

json ParseBody(const HttpResponse& response, const char* what) {
  try {
    return json::parse(response.body);
  } catch (const json::exception&) {
    ThrowUnexpected(std::string(what) + ": body is not JSON", response.status);
  }
}

}  // namespace

std::string EncodeBase64(std::span<const uint8_t> bytes) {
  if (bytes.empty()) {
    return {};
  }
  std::string out(4 * ((bytes.size() + 2) / 3), '\0');
  const int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), bytes.data(),
                                      static_cast<int>(bytes.size()));
  out.resize(static_cast<size_t>(written));
  return out;
}

std::optional<std::vector<uint8_t>> DecodeBase64(std::string_view text) {
  std::string compact;
  compact.reserve(text.size());
  for (char c : text) {
    if (c != '\n' && c != '\r' && c != ' ' && c != '\t') {
      compact.push_back(c);
    }
  }
  if (compact.empty()) {
    return std::vector<uint8_t>{};
  }
  if (compact.size() % 4 != 0) {
    return std::nullopt;
  }
  std::vector<uint8_t> out(compact.size() / 4 * 3);
  const int decoded = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(compact.data()),
                                      static_cast<int>(compact.size()));
  if (decoded < 0) {
    return std::nullopt;
  }
  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  size_t padding = 0;
  if (compact.back() == '=') {
    ++padding;
    if (compact[compact.size() - 2] == '=') {
      ++padding;
    }
  }
  out.resize(static_cast<size_t>(decoded) - padding);
  return out;
}

GitHubRemoteStore::GitHubRemoteStore(orchestrator::RemoteConfig config, HttpTransport transport)
    : config_(std::move(config)), transport_(std::move(transport)) {
  if (!config_.Complete()) {
    throw Error(ErrorDomain::Config, errors::config::kRemoteNotConfigured,
                std::string(errors::msg::kRemoteNotConfigured));
  }
  while (!config_.api_base.empty() && config_.api_base.back() == '/') {
    config_.api_base.pop_back();
  }
}

std::string GitHubRemoteStore::ContentsUrl(const std::string& path) const {
  return config_.api_base + "/repos/" + config_.repo + "/contents/" + EncodePath(path);
}

HttpRequest GitHubRemoteStore::BaseRequest(std::string method, const std::string& path) const {
  HttpRequest request;
  request.method = std::move(method);
  request.url = ContentsUrl(path);
  request.headers.emplace_back("Authorization", "token " + config_.token);
  request.headers.emplace_back("User-Agent", std::string(kUserAgent));
  request.headers.emplace_back("Accept", "application/vnd.github.v3+json");
  return request;
}

std::optional<orchestrator::RemoteBlob> GitHubRemoteStore::GetBlob(const std::string& path) {
  const auto response = transport_(BaseRequest("GET", path));
  if (response.status == kHttpNotFound) {
    return std::nullopt;
  }
  if (response.status != kHttpOk) {
    ThrowUnexpected("GET " + path, response.status);
  }

  const auto body = ParseBody(response, "GET");
  // Directories come back as arrays; anything that is not a file is absent.
  if (!body.is_object() || body.value("type", std::string()) != "file") {
    return std::nullopt;
  }
  const auto content = body.value("content", std::string());
  auto bytes = DecodeBase64(content);
  if (!bytes) {
    ThrowUnexpected("GET " + path + ": content is not base64", response.status);
  }

  orchestrator::RemoteBlob blob;
  blob.bytes = std::move(*bytes);
  blob.revision = body.value("sha", std::string());
  return blob;
}

std::string GitHubRemoteStore::PutBlob(const std::string& path, std::span<const uint8_t> bytes,
                                       const std::optional<std::string>& expected_revision) {
  const auto slash = path.find('/');
  const std::string project = path.substr(0, slash);

  json payload = {
      {"message", "Update environment backup for " + project},
      {"content", EncodeBase64(bytes)},
  };
  if (expected_revision) {
    payload["sha"] = *expected_revision;
  }

  auto request = BaseRequest("PUT", path);
  request.headers.emplace_back("Content-Type", "application/json");
  request.body = payload.dump();

  const auto response = transport_(request);
  if (response.status == kHttpConflict || response.status == kHttpUnprocessable) {
    throw Error(ErrorDomain::Remote, errors::remote::kRemoteConflict,
                std::string(errors::msg::kRemoteConflict), static_cast<int>(response.status),
                Retryability::kRetryable);
  }
  if (response.status != kHttpOk && response.status != kHttpCreated) {
    ThrowUnexpected("PUT " + path, response.status);
  }

  const auto body = ParseBody(response, "PUT");
  if (!body.is_object() || !body.contains("content") || !body["content"].is_object()) {
    ThrowUnexpected("PUT " + path + ": missing content", response.status);
  }
  return body["content"].value("sha", std::string());
}

}  // namespace secenv::platform
