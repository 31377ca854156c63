#pragma once

#include <chrono>
#include <curl/curl.h>
#include <string>
#include <unordered_map>

namespace mdjobs {

// RAII wrapper for a CURL easy handle
class CurlHandle {
public:
  CurlHandle();
  ~CurlHandle();

  CurlHandle(const CurlHandle &) = delete;
  CurlHandle &operator=(const CurlHandle &) = delete;

  CurlHandle(CurlHandle &&other) noexcept;
  CurlHandle &operator=(CurlHandle &&other) noexcept;

  CURL *get() const { return handle_; }

private:
  CURL *handle_;
};

struct HttpResponse {
  long status = 0;
  std::string body;

  bool ok() const { return status >= 200 && status < 300; }
};

using HttpHeaders = std::unordered_map<std::string, std::string>;

/**
 * Blocking HTTP client over libcurl. Each request uses its own easy handle,
 * so one client may be shared by concurrent workers.
 *
 * Transport failures (DNS, connect, timeout) throw
 * SystemException(NETWORK_ERROR); any HTTP status is returned as-is.
 */
class HttpClient {
public:
  explicit HttpClient(std::chrono::seconds timeout = std::chrono::seconds(60),
                      std::chrono::seconds connectTimeout =
                          std::chrono::seconds(10));

  HttpResponse get(const std::string &url,
                   const HttpHeaders &headers = {}) const;
  HttpResponse post(const std::string &url, const std::string &body,
                    const HttpHeaders &headers = {{"Content-Type",
                                                   "application/json"}}) const;

  static std::string urlEncode(const std::string &value);

private:
  std::chrono::seconds timeout_;
  std::chrono::seconds connectTimeout_;

  HttpResponse perform(const std::string &url, const std::string &method,
                       const std::string &body,
                       const HttpHeaders &headers) const;
  static size_t writeCallback(void *contents, size_t size, size_t nmemb,
                              std::string *output);
};

} // namespace mdjobs
