#include "market_data_provider.hpp"
#include "symbol_filter.hpp"

namespace mdjobs {

UpsertCounts InMemoryBarStore::upsertBars(const std::string &symbol,
                                          const std::vector<Bar> &bars,
                                          const std::string &source) {
  std::lock_guard<std::mutex> lock(mutex_);
  UpsertCounts counts;
  for (const auto &bar : bars) {
    auto key = std::make_pair(symbol, bar.date);
    auto it = bars_.find(key);
    if (it == bars_.end()) {
      bars_.emplace(key, StoredBar{bar, source});
      counts.inserted++;
    } else if (it->second.bar != bar || it->second.source != source) {
      it->second = StoredBar{bar, source};
      counts.updated++;
    } else {
      counts.skipped++;
    }
  }
  return counts;
}

size_t InMemoryBarStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bars_.size();
}

bool InMemoryBarStore::contains(const std::string &symbol,
                                const std::string &date) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return bars_.count(std::make_pair(symbol, date)) > 0;
}

StaticSymbolUniverse::StaticSymbolUniverse(std::vector<SymbolRecord> rows)
    : rows_(std::move(rows)) {}

std::vector<std::string> StaticSymbolUniverse::resolveSymbolUniverse() {
  return filterSymbols(rows_);
}

} // namespace mdjobs
