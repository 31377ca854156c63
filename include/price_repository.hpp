#pragma once

#include "market_data_provider.hpp"
#include <memory>

namespace mdjobs {

class DatabaseManager;

// prices_daily table
class PriceRepository : public BarStore {
public:
  explicit PriceRepository(std::shared_ptr<DatabaseManager> dbManager);

  // Throws SystemException(DATABASE_ERROR) when the statement fails
  UpsertCounts upsertBars(const std::string &symbol,
                          const std::vector<Bar> &bars,
                          const std::string &source) override;

private:
  std::shared_ptr<DatabaseManager> dbManager_;
};

// symbols reference table filtered by the symbol rules
class SymbolRepository : public SymbolUniverse {
public:
  explicit SymbolRepository(std::shared_ptr<DatabaseManager> dbManager);

  std::vector<std::string> resolveSymbolUniverse() override;

private:
  std::shared_ptr<DatabaseManager> dbManager_;
};

} // namespace mdjobs
