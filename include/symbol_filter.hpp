#pragma once

#include "job_models.hpp"
#include <string>
#include <vector>

namespace mdjobs {

// Excludes empty symbols, test issues and warrant/right/unit suffixes
bool isExcludedSymbol(const std::string &symbol, const std::string &testIssue);

// Keeps input order
std::vector<std::string> filterSymbols(const std::vector<SymbolRecord> &rows);

} // namespace mdjobs
