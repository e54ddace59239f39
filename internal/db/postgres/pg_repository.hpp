#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "pg_pool.hpp"
#include "pg_tx.hpp"

namespace shortener::db::postgres {

class PgRepository final : public db::Repository {
 public:
  explicit PgRepository(std::shared_ptr<PgPool> pool);

  // Creates the links table and its unique short_code index if missing.
  static void BootstrapSchema(PgPool& pool);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLink(Transaction&, model::LinkRecord&) override;
  std::optional<model::LinkRecord> FindLinkByShortCode(Transaction&, const std::string&) override;
  uint64_t CountLinks(Transaction&) override;
  std::vector<std::string> RecentShortCodes(Transaction&, std::size_t limit) override;

 private:
  std::shared_ptr<PgPool> pool_;

  static PgTransaction& TX(Transaction& t);
  static Result Translate(const std::exception& e);
};

} // namespace shortener::db::postgres
