#include "symbol_filter.hpp"
#include "logger.hpp"
#include <array>

namespace mdjobs {

namespace {
const std::array<const char *, 4> kExcludedSuffixes = {".WS", ".RT", ".UN",
                                                       ".WT"};

bool endsWith(const std::string &text, const std::string &suffix) {
  return text.size() >= suffix.size() &&
         text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}
} // namespace

bool isExcludedSymbol(const std::string &symbol, const std::string &testIssue) {
  if (symbol.empty()) {
    return true;
  }
  if (testIssue == "Y" || testIssue == "y") {
    return true;
  }
  for (const char *suffix : kExcludedSuffixes) {
    if (endsWith(symbol, suffix)) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> filterSymbols(const std::vector<SymbolRecord> &rows) {
  std::vector<std::string> filtered;
  filtered.reserve(rows.size());
  for (const auto &row : rows) {
    if (!isExcludedSymbol(row.symbol, row.testIssue)) {
      filtered.push_back(row.symbol);
    }
  }
  SCAN_LOG_INFO("Filtered {} symbols down to {} valid symbols", rows.size(),
                filtered.size());
  return filtered;
}

} // namespace mdjobs
