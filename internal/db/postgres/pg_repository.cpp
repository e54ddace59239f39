#include "pg_repository.hpp"

#include <chrono>

namespace shortener::db::postgres {

namespace {

uint64_t NowMs() {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

void PgRepository::BootstrapSchema(PgPool& pool) {
  auto       conn = pool.Acquire();
  pqxx::work tx(*conn);

  tx.exec("CREATE TABLE IF NOT EXISTS links (id BIGSERIAL PRIMARY KEY, original_url TEXT NOT NULL, short_code VARCHAR(6) NOT NULL, created_at_ms BIGINT NOT NULL);");
  tx.exec("CREATE UNIQUE INDEX IF NOT EXISTS index_links_on_short_code ON links(short_code);");
  tx.commit();
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

Result PgRepository::InsertLink(Transaction& t, model::LinkRecord& r) {
  if (r.created_at_ms == 0) r.created_at_ms = NowMs();
  try {
    auto res = TX(t).Work().exec_prepared1("insert_link", r.original_url, r.short_code, r.created_at_ms);
    r.id     = res[0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::LinkRecord> PgRepository::FindLinkByShortCode(Transaction& t, const std::string& short_code) {
  auto res = TX(t).Work().exec_prepared("find_link_by_short_code", short_code);
  if (res.empty()) return std::nullopt;

  model::LinkRecord r;
  r.id            = res[0][0].as<int64_t>();
  r.original_url  = res[0][1].c_str();
  r.short_code    = res[0][2].c_str();
  r.created_at_ms = res[0][3].as<uint64_t>();
  return r;
}

uint64_t PgRepository::CountLinks(Transaction& t) {
  auto res = TX(t).Work().exec_prepared1("count_links");
  return res[0].as<uint64_t>();
}

std::vector<std::string> PgRepository::RecentShortCodes(Transaction& t, std::size_t limit) {
  auto res = TX(t).Work().exec_prepared("recent_short_codes", static_cast<int64_t>(limit));

  std::vector<std::string> codes;
  codes.reserve(res.size());
  for (const auto& row : res) codes.emplace_back(row[0].c_str());
  return codes;
}

} // namespace shortener::db::postgres
