#pragma once

#include <stdexcept>

namespace shortener::db {

/*
  One unit of link-store work.

  A link inserted through a transaction is visible to other transactions
  only after Commit(). A transaction destroyed without Commit() rolls
  back, so an attempt that hit a duplicate short code leaves nothing.

  SQLite: BEGIN IMMEDIATE under the connection mutex
  Postgres: pqxx::work on a pooled connection
  Memory: write set checked against committed links at Commit()
*/

// Thrown by Commit() when a short code in the write set was committed by
// another transaction first.
class UniqueConflict : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

class Transaction {
 public:
  virtual ~Transaction() = default;

  // commit changes atomically
  virtual void Commit() = 0;

  // explicit rollback
  virtual void Rollback() = 0;

  // true if commit already performed
  virtual bool IsCommitted() const = 0;
};

} // namespace shortener::db
