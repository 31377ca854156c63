#include "service_clients.hpp"
#include "job_exceptions.hpp"
#include "logger.hpp"

namespace mdjobs {

namespace {

double numberField(const nlohmann::json &object, const char *key) {
  auto it = object.find(key);
  if (it == object.end() || it->is_null()) {
    return 0.0;
  }
  if (it->is_string()) {
    return std::stod(it->get<std::string>());
  }
  return it->get<double>();
}

std::optional<int64_t> optionalInteger(const nlohmann::json &object,
                                       const char *key) {
  auto it = object.find(key);
  if (it == object.end() || !it->is_number()) {
    return std::nullopt;
  }
  return it->get<int64_t>();
}

std::string joinSymbols(const std::vector<std::string> &symbols) {
  std::string joined;
  for (const auto &symbol : symbols) {
    if (!joined.empty()) {
      joined += ",";
    }
    joined += symbol;
  }
  return joined;
}

} // namespace

TokenStatus TokenStatus::fromJson(const nlohmann::json &json) {
  TokenStatus status;
  status.valid = json.value("valid", false);
  status.stale = json.value("stale", true);
  status.credentialsAvailable = json.value("credentials_available", false);
  status.expiresIn = optionalInteger(json, "expires_in");
  status.ageSeconds = optionalInteger(json, "age_seconds");
  if (auto it = json.find("message"); it != json.end() && it->is_string()) {
    status.message = it->get<std::string>();
  }
  return status;
}

std::vector<Bar> parseBars(const nlohmann::json &json) {
  std::vector<Bar> bars;
  if (!json.is_array()) {
    return bars;
  }
  bars.reserve(json.size());
  for (const auto &item : json) {
    if (!item.is_object()) {
      continue;
    }
    Bar bar;
    bar.date = item.value("date", "");
    bar.open = numberField(item, "open");
    bar.high = numberField(item, "high");
    bar.low = numberField(item, "low");
    bar.close = numberField(item, "close");
    bar.volume = static_cast<int64_t>(numberField(item, "volume"));
    bars.push_back(bar);
  }
  return bars;
}

ExternalApiClient::ExternalApiClient(std::string baseUrl,
                                     std::shared_ptr<HttpClient> http)
    : baseUrl_(std::move(baseUrl)), http_(std::move(http)) {}

std::vector<Bar> ExternalApiClient::fetchDailyBars(const std::string &symbol,
                                                   const DateRange &range) {
  const std::string url = baseUrl_ + "/schwab/history/" +
                          HttpClient::urlEncode(symbol) +
                          "/daily?start=" + range.startString() +
                          "&end=" + range.endString();

  HttpResponse response;
  try {
    response = http_->get(url);
  } catch (const SystemException &e) {
    const auto &context = e.getContext();
    auto timedOut = context.find("timed_out");
    const bool timeout = timedOut != context.end() && timedOut->second == "true";
    throw ProviderException(
        std::nullopt,
        std::string(timeout ? "Request timeout to " : "Request failed to ") +
            baseUrl_ + ": " + e.getMessage(),
        timeout ? ErrorCode::PROVIDER_TIMEOUT : ErrorCode::PROVIDER_ERROR,
        {{"symbol", symbol}});
  }

  if (response.status != 200) {
    throw ProviderException(static_cast<int>(response.status),
                            "External API returned " +
                                std::to_string(response.status) + ": " +
                                response.body,
                            ErrorCode::PROVIDER_ERROR, {{"symbol", symbol}});
  }

  try {
    return parseBars(nlohmann::json::parse(response.body));
  } catch (const std::exception &e) {
    throw ProviderException(std::nullopt,
                            std::string("Unexpected error: ") + e.what(),
                            ErrorCode::PROVIDER_ERROR, {{"symbol", symbol}});
  }
}

TokenStatus ExternalApiClient::getTokenStatus() const {
  HttpResponse response = http_->get(baseUrl_ + "/schwab/token/status");
  if (response.status != 200) {
    throw ProviderException(static_cast<int>(response.status),
                            "Token status endpoint returned HTTP " +
                                std::to_string(response.status));
  }
  try {
    return TokenStatus::fromJson(nlohmann::json::parse(response.body));
  } catch (const nlohmann::json::exception &e) {
    throw ProviderException(std::nullopt,
                            std::string("Invalid token status response: ") +
                                e.what());
  }
}

void ExternalApiClient::preWarmToken() {
  TokenStatus status;
  try {
    status = getTokenStatus();
  } catch (const JobsException &e) {
    throw AuthException("Pre-warm token failed: " + e.getMessage());
  }
  if (!status.credentialsAvailable) {
    throw AuthException("Provider credentials are not configured");
  }
  HTTP_LOG_DEBUG("Provider token pre-warmed (valid={}, stale={})", status.valid,
                 status.stale);
}

nlohmann::json
ExternalApiClient::getQuotes(const std::vector<std::string> &symbols) const {
  const std::string url = baseUrl_ + "/finnhub/quotes?symbols=" +
                          HttpClient::urlEncode(joinSymbols(symbols));
  HttpResponse response = http_->get(url);
  if (!response.ok()) {
    throw ProviderException(static_cast<int>(response.status),
                            "Quote endpoint returned HTTP " +
                                std::to_string(response.status));
  }
  return nlohmann::json::parse(response.body);
}

BackendClient::BackendClient(std::string baseUrl,
                             std::shared_ptr<HttpClient> http)
    : baseUrl_(std::move(baseUrl)), http_(std::move(http)) {}

nlohmann::json BackendClient::parse(const HttpResponse &response,
                                    const std::string &path) const {
  if (!response.ok()) {
    throw SystemException(ErrorCode::NETWORK_ERROR,
                          "Backend " + path + " returned HTTP " +
                              std::to_string(response.status),
                          "BackendClient",
                          {{"path", path},
                           {"status", std::to_string(response.status)}});
  }
  if (response.body.empty()) {
    return nlohmann::json::object();
  }
  try {
    return nlohmann::json::parse(response.body);
  } catch (const nlohmann::json::parse_error &e) {
    throw SystemException(ErrorCode::NETWORK_ERROR,
                          "Backend " + path + " returned invalid JSON: " +
                              e.what(),
                          "BackendClient", {{"path", path}});
  }
}

std::vector<std::string> BackendClient::getWatchlistSymbols() const {
  const std::string path = "/api/watchlists/symbols";
  auto json = parse(http_->get(baseUrl_ + path), path);
  std::vector<std::string> symbols;
  if (!json.is_array()) {
    return symbols;
  }
  for (const auto &item : json) {
    if (item.is_string()) {
      symbols.push_back(item.get<std::string>());
    } else if (item.is_object() && item.contains("symbol")) {
      symbols.push_back(item["symbol"].get<std::string>());
    }
  }
  return symbols;
}

nlohmann::json BackendClient::refreshUniverse() const {
  return postJob("/api/universe/refresh");
}

nlohmann::json BackendClient::runTechAnalysis() const {
  return postJob("/api/tech/run");
}

int64_t BackendClient::storePrices(const nlohmann::json &pricesData) const {
  const std::string path = "/api/prices/store-prices";
  nlohmann::json body;
  body["prices_data"] = pricesData;
  auto json = parse(http_->post(baseUrl_ + path, body.dump()), path);
  return json.value("total_stored", static_cast<int64_t>(0));
}

nlohmann::json BackendClient::postJob(const std::string &path) const {
  return parse(http_->post(baseUrl_ + path, "{}"), path);
}

} // namespace mdjobs
