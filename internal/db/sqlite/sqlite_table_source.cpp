#include "sqlite_table_source.hpp"

#include <stdexcept>
#include <utility>

namespace annoschema::db::sqlite {

namespace {

constexpr const char* kListTables =
    "SELECT name FROM sqlite_master"
    " WHERE type='table' AND name NOT LIKE 'sqlite_%'"
    " ORDER BY name;";

} // namespace

SqliteTableSource::SqliteTableSource(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::vector<std::string> SqliteTableSource::ListTableNames() {
  sqlite3_stmt* stmt = db_->Prepare(kListTables);

  std::vector<std::string> names;
  int                      rc;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    const auto* text = sqlite3_column_text(stmt, 0);
    if (text) names.emplace_back(reinterpret_cast<const char*>(text));
  }
  std::string error = rc == SQLITE_DONE ? "" : sqlite3_errmsg(db_->Handle());
  sqlite3_finalize(stmt);

  if (rc != SQLITE_DONE) {
    throw std::runtime_error("sqlite list tables: " + error);
  }
  return names;
}

} // namespace annoschema::db::sqlite
