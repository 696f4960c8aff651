#pragma once

#include <sqlite3.h>

#include <cstdint>
#include <string>

namespace scavenger::db::sqlite {

/*
  Owns one sqlite3 connection for the ledger database.

  Opening applies the connection pragmas the repository relies on:
  foreign keys on, a busy timeout for BEGIN IMMEDIATE, and WAL journaling
  when requested and the database is file backed.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, bool wal_mode = true);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements that return no rows. Throws std::runtime_error.
  void Exec(const std::string& sql);

  // Caller owns the statement and must sqlite3_finalize it.
  sqlite3_stmt* Prepare(const std::string& sql);

  // PRAGMA user_version, used as the schema version.
  int64_t UserVersion();
  void    SetUserVersion(int64_t version);

 private:
  void ApplyPragmas(bool wal_mode);

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace scavenger::db::sqlite
