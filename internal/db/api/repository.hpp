#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/link_record.hpp"

namespace shortener::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - short_code is unique across all committed links; a duplicate insert
    returns ErrorCode::ConstraintViolation and nothing else does
  - Links are immutable once committed

  The DB is the source of truth for:
    short_code -> original_url
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Links
  // ---------------------------------------------------------------------

  // Assigns record.id and, when zero, record.created_at_ms.
  virtual Result InsertLink(Transaction&, model::LinkRecord& record) = 0;

  virtual std::optional<model::LinkRecord> FindLinkByShortCode(Transaction&, const std::string& short_code) = 0;

  virtual uint64_t CountLinks(Transaction&) = 0;

  // Short codes of the `limit` most recently inserted links, newest first.
  virtual std::vector<std::string> RecentShortCodes(Transaction&, std::size_t limit) = 0;
};

} // namespace shortener::db
