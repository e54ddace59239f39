#include "memory_tx.hpp"

namespace shortener::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
}

MemoryTransaction::~MemoryTransaction() {
  if (!committed_ && !rolled_back_) Rollback();
}

void MemoryTransaction::Commit() {
  std::scoped_lock lock(repo_.mutex_);
  for (const auto& [code, _] : writes_) {
    if (repo_.committed_.contains(code)) {
      throw UniqueConflict("transaction conflict: short_code '" + code + "' committed concurrently");
    }
  }
  for (auto& [code, record] : writes_) {
    repo_.committed_.emplace(code, std::move(record));
  }
  writes_.clear();
  committed_ = true;
}

void MemoryTransaction::Rollback() {
  writes_.clear();
  rolled_back_ = true;
}

} // namespace shortener::db::memory
