#pragma once

#include <string>
#include <vector>

namespace mdjobs {

class DatabaseSchema {
public:
  static std::vector<std::string> getCreateTableStatements();
  static std::vector<std::string> getIndexStatements();
};

} // namespace mdjobs
