#include "secenv/platform/http_transport.h"

#include <curl/curl.h>

#include <memory>
#include <mutex>
#include <string>

#include "secenv/error.h"
#include "secenv/orchestrator/event_bus.h"

namespace secenv::platform {
namespace {

constexpr long kConnectTimeoutMs = 10000;
constexpr long kRequestTimeoutMs = 60000;

struct CurlEasyDeleter {
  void operator()(CURL* handle) const noexcept { curl_easy_cleanup(handle); }
};
using CurlEasyPtr = std::unique_ptr<CURL, CurlEasyDeleter>;

struct CurlSlistDeleter {
  void operator()(curl_slist* list) const noexcept { curl_slist_free_all(list); }
};
using CurlSlistPtr = std::unique_ptr<curl_slist, CurlSlistDeleter>;

[[noreturn]] void ThrowTransportError(const std::string& message, int native) {
  throw Error(ErrorDomain::Remote, errors::remote::kTransportFailed, message, native,
              Retryability::kTransient);
}

void EnsureCurlInitialized() {
  static std::once_flag once;
  static CURLcode init_result = CURLE_OK;
  std::call_once(once, [] { init_result = curl_global_init(CURL_GLOBAL_DEFAULT); });
  if (init_result != CURLE_OK) {
    ThrowTransportError(std::string("libcurl initialization failed: ") + curl_easy_strerror(init_result),
                        static_cast<int>(init_result));
  }
}

size_t AppendBody(char* data, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  body->append(data, size * nmemb);
  return size * nmemb;
}

HttpResponse PerformCurlRequest(const HttpRequest& request) {
  EnsureCurlInitialized();

  CurlEasyPtr curl(curl_easy_init());
  if (!curl) {
    ThrowTransportError("curl_easy_init failed", 0);
  }

  CurlSlistPtr headers;
  for (const auto& [name, value] : request.headers) {
    const std::string line = name + ": " + value;
    curl_slist* appended = curl_slist_append(headers.get(), line.c_str());
    if (!appended) {
      ThrowTransportError("curl_slist_append failed", 0);
    }
    headers.release();
    headers.reset(appended);
  }

  HttpResponse response;
  char error_buffer[CURL_ERROR_SIZE] = {0};

  bool ok = true;
  CURL* handle = curl.get();
  ok &= curl_easy_setopt(handle, CURLOPT_URL, request.url.c_str()) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_ERRORBUFFER, error_buffer) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_SSL_VERIFYPEER, 1L) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_SSL_VERIFYHOST, 2L) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_CONNECTTIMEOUT_MS, kConnectTimeoutMs) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_TIMEOUT_MS, kRequestTimeoutMs) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_NOSIGNAL, 1L) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_HTTPHEADER, headers.get()) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_WRITEFUNCTION, &AppendBody) == CURLE_OK;
  ok &= curl_easy_setopt(handle, CURLOPT_WRITEDATA, &response.body) == CURLE_OK;
  if (request.method == "GET") {
    ok &= curl_easy_setopt(handle, CURLOPT_HTTPGET, 1L) == CURLE_OK;
  } else {
    ok &= curl_easy_setopt(handle, CURLOPT_CUSTOMREQUEST, request.method.c_str()) == CURLE_OK;
    ok &= curl_easy_setopt(handle, CURLOPT_POSTFIELDS, request.body.data()) == CURLE_OK;
    ok &= curl_easy_setopt(handle, CURLOPT_POSTFIELDSIZE_LARGE,
                           static_cast<curl_off_t>(request.body.size())) == CURLE_OK;
  }
  if (!ok) {
    ThrowTransportError("Failed to set libcurl options", 0);
  }

  const CURLcode res = curl_easy_perform(handle);
  if (res != CURLE_OK) {
    std::string detail = error_buffer[0] ? std::string(error_buffer) : curl_easy_strerror(res);
    ThrowTransportError(request.method + " request failed: " + detail, static_cast<int>(res));
  }
  curl_easy_getinfo(handle, CURLINFO_RESPONSE_CODE, &response.status);

  orchestrator::Event event;
  event.category = orchestrator::EventCategory::kDiagnostics;
  event.severity = orchestrator::EventSeverity::kDebug;
  event.event_id = "http_request";
  event.message = "HTTP request completed";
  event.fields.emplace_back("method", request.method);
  event.fields.emplace_back("url", request.url, orchestrator::FieldPrivacy::kHash);
  event.fields.emplace_back("status", std::to_string(response.status),
                            orchestrator::FieldPrivacy::kPublic, true);
  orchestrator::EventBus::Instance().Publish(event);
  return response;
}

}  // namespace

HttpTransport MakeCurlTransport() {
  return &PerformCurlRequest;
}

}  // namespace secenv::platform
