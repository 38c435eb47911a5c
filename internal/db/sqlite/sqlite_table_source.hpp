#pragma once

#include <memory>

#include "internal/db/table_source.hpp"
#include "sqlite_db.hpp"

namespace annoschema::db::sqlite {

class SqliteTableSource : public TableNameSource {
 public:
  explicit SqliteTableSource(std::shared_ptr<SqliteDB> db);

  // user tables only, sorted by name
  std::vector<std::string> ListTableNames() override;

 private:
  std::shared_ptr<SqliteDB> db_;
};

} // namespace annoschema::db::sqlite
