#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace shortener::db::sqlite {

/*
  SQLite transaction wrapper.

  Uses BEGIN IMMEDIATE:
    - grabs write lock early
    - avoids deadlock-y behavior later
    - serializes writers across processes sharing the file

  Holds the connection mutex until destroyed.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction();

  sqlite3* Handle() const { return db_->Handle(); }
  SqliteDB& DB() const { return *db_; }

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override { return committed_; }

 private:
  std::shared_ptr<SqliteDB> db_;
  std::unique_lock<std::recursive_mutex> lock_;
  bool committed_ = false;
  bool finished_ = false;
};

} // namespace shortener::db::sqlite
