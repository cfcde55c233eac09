#pragma once

#include <string>
#include <utility>
#include <vector>
#include <functional>

namespace secenv::platform {

struct HttpRequest {
  std::string method{"GET"};
  std::string url;
  std::vector<std::pair<std::string, std::string>> headers;
  std::string body;
};

struct HttpResponse {
  long status{0};
  std::string body;
};

// Performs one request. Throws Error{Remote, kTransportFailed} when no HTTP
// response was received; any status code is returned to the caller.
using HttpTransport = std::function<HttpResponse(const HttpRequest&)>;

// libcurl-backed transport with peer verification and bounded timeouts.
HttpTransport MakeCurlTransport();

}  // namespace secenv::platform
