#pragma once

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace shortener::db::memory {

/*
  Transaction = committed view + write set

  Reads consult the write set first, then the committed map. Uniqueness is
  checked at insert time and again at commit, so two transactions racing on
  the same short_code cannot both commit.
*/

class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction();

  void Commit() override;
  void Rollback() override;
  bool IsCommitted() const override {
    return committed_;
  }

  MemoryRepository& Repo() {
    return repo_;
  }
  MemoryRepository::LinkMap& Writes() {
    return writes_;
  }

 private:
  MemoryRepository&         repo_;
  MemoryRepository::LinkMap writes_;
  bool                      committed_   = false;
  bool                      rolled_back_ = false;
};

} // namespace shortener::db::memory
