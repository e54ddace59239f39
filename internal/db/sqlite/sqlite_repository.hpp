#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace shortener::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  // Creates the links table and its unique short_code index if missing.
  static void BootstrapSchema(SqliteDB& db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertLink(Transaction&, model::LinkRecord&) override;
  std::optional<model::LinkRecord> FindLinkByShortCode(Transaction&, const std::string&) override;
  uint64_t CountLinks(Transaction&) override;
  std::vector<std::string> RecentShortCodes(Transaction&, std::size_t limit) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

} // namespace shortener::db::sqlite
