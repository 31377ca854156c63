#include "http_client.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"
#include <cstdlib>
#include <memory>
#include <mutex>

namespace mdjobs {

namespace {

void ensureCurlGlobalInit() {
  static std::once_flag once;
  std::call_once(once, []() {
    curl_global_init(CURL_GLOBAL_DEFAULT);
    std::atexit([]() { curl_global_cleanup(); });
  });
}

} // namespace

CurlHandle::CurlHandle() : handle_(nullptr) {
  ensureCurlGlobalInit();
  handle_ = curl_easy_init();
  if (!handle_) {
    throw SystemException(ErrorCode::RESOURCE_EXHAUSTED,
                          "Failed to initialize CURL handle", "HttpClient");
  }
}

CurlHandle::~CurlHandle() {
  if (handle_) {
    curl_easy_cleanup(handle_);
  }
}

CurlHandle::CurlHandle(CurlHandle &&other) noexcept : handle_(other.handle_) {
  other.handle_ = nullptr;
}

CurlHandle &CurlHandle::operator=(CurlHandle &&other) noexcept {
  if (this != &other) {
    if (handle_) {
      curl_easy_cleanup(handle_);
    }
    handle_ = other.handle_;
    other.handle_ = nullptr;
  }
  return *this;
}

HttpClient::HttpClient(std::chrono::seconds timeout,
                       std::chrono::seconds connectTimeout)
    : timeout_(timeout), connectTimeout_(connectTimeout) {
  ensureCurlGlobalInit();
}

HttpResponse HttpClient::get(const std::string &url,
                             const HttpHeaders &headers) const {
  return perform(url, "GET", "", headers);
}

HttpResponse HttpClient::post(const std::string &url, const std::string &body,
                              const HttpHeaders &headers) const {
  return perform(url, "POST", body, headers);
}

std::string HttpClient::urlEncode(const std::string &value) {
  CurlHandle curl;
  std::unique_ptr<char, decltype(&curl_free)> encoded(
      curl_easy_escape(curl.get(), value.c_str(),
                       static_cast<int>(value.length())),
      curl_free);
  if (!encoded) {
    return value;
  }
  return std::string(encoded.get());
}

size_t HttpClient::writeCallback(void *contents, size_t size, size_t nmemb,
                                 std::string *output) {
  const size_t total = size * nmemb;
  output->append(static_cast<char *>(contents), total);
  return total;
}

HttpResponse HttpClient::perform(const std::string &url,
                                 const std::string &method,
                                 const std::string &body,
                                 const HttpHeaders &headers) const {
  CurlHandle curl;
  HttpResponse response;

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  if (method == "POST") {
    curl_easy_setopt(curl.get(), CURLOPT_POST, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE,
                     static_cast<long>(body.length()));
  }

  std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> headerList(
      nullptr, curl_slist_free_all);
  for (const auto &[key, value] : headers) {
    const std::string header = key + ": " + value;
    headerList.reset(curl_slist_append(headerList.release(), header.c_str()));
  }
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headerList.get());

  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeCallback);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT,
                   static_cast<long>(timeout_.count()));
  curl_easy_setopt(curl.get(), CURLOPT_CONNECTTIMEOUT,
                   static_cast<long>(connectTimeout_.count()));

  HTTP_LOG_DEBUG("{} {}", method, url);
  const CURLcode res = curl_easy_perform(curl.get());
  if (res != CURLE_OK) {
    throw SystemException(ErrorCode::NETWORK_ERROR,
                          method + " " + url + " failed: " +
                              curl_easy_strerror(res),
                          "HttpClient",
                          {{"url", url},
                           {"timed_out",
                            res == CURLE_OPERATION_TIMEDOUT ? "true" : "false"}});
  }

  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
  return response;
}

} // namespace mdjobs
