#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "secenv/orchestrator/config_store.h"
#include "secenv/orchestrator/remote_store.h"
#include "secenv/platform/http_transport.h"

namespace secenv::platform {

inline constexpr std::string_view kUserAgent = "SecuredEnv/1.0.0";

// RemoteStore over the GitHub contents API. The blob SHA is the revision.
class GitHubRemoteStore final : public orchestrator::RemoteStore {
public:
  explicit GitHubRemoteStore(orchestrator::RemoteConfig config,
                             HttpTransport transport = MakeCurlTransport());

  std::optional<orchestrator::RemoteBlob> GetBlob(const std::string& path) override;
  std::string PutBlob(const std::string& path, std::span<const uint8_t> bytes,
                      const std::optional<std::string>& expected_revision) override;

  std::string ContentsUrl(const std::string& path) const;

private:
  HttpRequest BaseRequest(std::string method, const std::string& path) const;

  orchestrator::RemoteConfig config_;
  HttpTransport transport_;
};

std::string EncodeBase64(std::span<const uint8_t> bytes);
// Ignores embedded line breaks. nullopt on malformed input.
std::optional<std::vector<uint8_t>> DecodeBase64(std::string_view text);

}  // namespace secenv::platform
