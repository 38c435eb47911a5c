#pragma once

#include <sqlite3.h>

#include <string>

namespace annoschema::db::sqlite {

/*
  Thin RAII wrapper around sqlite3*.
*/
class SqliteDB {
 public:
  enum class Mode {
    kReadOnly,
    kReadWrite,
  };

  explicit SqliteDB(std::string path, Mode mode = Mode::kReadOnly);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (tests use it to seed databases)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace annoschema::db::sqlite
