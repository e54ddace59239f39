#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>

#include "internal/db/api/repository.hpp"

namespace shortener::db::memory {

class MemoryTransaction;

class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLink(Transaction&, model::LinkRecord&) override;
  std::optional<model::LinkRecord> FindLinkByShortCode(Transaction&, const std::string&) override;
  uint64_t CountLinks(Transaction&) override;
  std::vector<std::string> RecentShortCodes(Transaction&, std::size_t limit) override;

 private:
  friend class MemoryTransaction;

  // short_code -> link
  using LinkMap = std::unordered_map<std::string, model::LinkRecord>;

  std::mutex mutex_;
  LinkMap committed_;
  int64_t next_id_ = 1;
};

} // namespace shortener::db::memory
