#pragma once

#include <string>
#include <vector>

namespace annoschema::db {

/*
  Enumerates the table names that already exist in a storage target.
  Used only for version discovery.
*/
class TableNameSource {
 public:
  virtual ~TableNameSource() = default;

  virtual std::vector<std::string> ListTableNames() = 0;
};

} // namespace annoschema::db
