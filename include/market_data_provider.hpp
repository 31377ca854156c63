#pragma once

#include "job_models.hpp"
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace mdjobs {

// Upstream daily price history
class MarketDataProvider {
public:
  virtual ~MarketDataProvider() = default;

  // Throws AuthException when the upstream cannot authenticate
  virtual void preWarmToken() = 0;

  // Throws ProviderException; an empty result means no bars in range
  virtual std::vector<Bar> fetchDailyBars(const std::string &symbol,
                                          const DateRange &range) = 0;
};

// Idempotent insert-or-update keyed by (symbol, date)
class BarStore {
public:
  virtual ~BarStore() = default;

  virtual UpsertCounts upsertBars(const std::string &symbol,
                                  const std::vector<Bar> &bars,
                                  const std::string &source) = 0;
};

// Filtered list of symbols to scan
class SymbolUniverse {
public:
  virtual ~SymbolUniverse() = default;

  virtual std::vector<std::string> resolveSymbolUniverse() = 0;
};

class InMemoryBarStore : public BarStore {
public:
  UpsertCounts upsertBars(const std::string &symbol,
                          const std::vector<Bar> &bars,
                          const std::string &source) override;

  size_t size() const;
  bool contains(const std::string &symbol, const std::string &date) const;

private:
  struct StoredBar {
    Bar bar;
    std::string source;
  };

  mutable std::mutex mutex_;
  std::map<std::pair<std::string, std::string>, StoredBar> bars_;
};

// Fixed symbol rows, filtered like the reference table
class StaticSymbolUniverse : public SymbolUniverse {
public:
  explicit StaticSymbolUniverse(std::vector<SymbolRecord> rows);

  std::vector<std::string> resolveSymbolUniverse() override;

private:
  std::vector<SymbolRecord> rows_;
};

} // namespace mdjobs
