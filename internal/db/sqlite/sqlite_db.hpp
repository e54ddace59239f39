#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace shortener::db::sqlite {

// Finalizes on scope exit.
using StatementPtr = std::unique_ptr<sqlite3_stmt, decltype(&sqlite3_finalize)>;

/*
  Thin RAII wrapper around sqlite3*.

  Shared by the link repository and the SQLite cache tier. The connection
  is not safe for concurrent transactions, so every user holds Mutex() for
  the duration of its statement or transaction.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  std::recursive_mutex& Mutex() {
    return mutex_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Execute a SQL string (used for pragmas/schema bootstrap)
  void Exec(const std::string& sql);

  StatementPtr Prepare(const std::string& sql);

  // Configure recommended PRAGMAs (WAL, busy timeout, etc.)
  void Configure();

 private:
  sqlite3*    db_ = nullptr;
  std::string path_;

  std::recursive_mutex mutex_;
};

} // namespace shortener::db::sqlite
