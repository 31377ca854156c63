#pragma once

#include "http_client.hpp"
#include "market_data_provider.hpp"
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace mdjobs {

struct TokenStatus {
  bool valid = false;
  bool stale = true;
  bool credentialsAvailable = false;
  std::optional<int64_t> expiresIn;
  std::optional<int64_t> ageSeconds;
  std::string message;

  static TokenStatus fromJson(const nlohmann::json &json);
};

/**
 * External market-data gateway: daily price history, live quotes and the
 * provider token status.
 */
class ExternalApiClient : public MarketDataProvider {
public:
  ExternalApiClient(std::string baseUrl, std::shared_ptr<HttpClient> http);

  void preWarmToken() override;
  std::vector<Bar> fetchDailyBars(const std::string &symbol,
                                  const DateRange &range) override;

  // Throws SystemException(NETWORK_ERROR) on transport failure and
  // ProviderException for a non-200 answer
  TokenStatus getTokenStatus() const;
  nlohmann::json getQuotes(const std::vector<std::string> &symbols) const;

private:
  std::string baseUrl_;
  std::shared_ptr<HttpClient> http_;
};

// Platform backend endpoints used by the delegated jobs
class BackendClient {
public:
  BackendClient(std::string baseUrl, std::shared_ptr<HttpClient> http);

  std::vector<std::string> getWatchlistSymbols() const;
  nlohmann::json refreshUniverse() const;
  nlohmann::json runTechAnalysis() const;
  // Returns total_stored from the response
  int64_t storePrices(const nlohmann::json &pricesData) const;

  // POST with an empty JSON body to a backend path
  nlohmann::json postJob(const std::string &path) const;

private:
  std::string baseUrl_;
  std::shared_ptr<HttpClient> http_;

  nlohmann::json parse(const HttpResponse &response,
                       const std::string &path) const;
};

std::vector<Bar> parseBars(const nlohmann::json &json);

} // namespace mdjobs
