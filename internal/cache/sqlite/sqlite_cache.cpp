#include "sqlite_cache.hpp"

#include <charconv>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/db/sqlite/sqlite_tx.hpp"
#include "internal/util/errors.hpp"

namespace shortener::cache::sqlite {

namespace sql = shortener::db::sql;
using db::sqlite::SqliteTransaction;
using db::sqlite::StatementPtr;

namespace {

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindExpiry(sqlite3_stmt* st, int idx, const std::optional<uint64_t>& expires_at_ms) {
  if (expires_at_ms) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*expires_at_ms));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void StepDone(sqlite3_stmt* st, sqlite3* db, const char* what) {
  if (sqlite3_step(st) != SQLITE_DONE) {
    throw std::runtime_error(std::string(what) + ": " + sqlite3_errmsg(db));
  }
}

// Every backend failure leaves as DependencyUnavailable.
template <typename Fn>
auto Guarded(const char* op, Fn&& fn) -> decltype(fn()) {
  try {
    return fn();
  } catch (const util::DependencyUnavailable&) {
    throw;
  } catch (const std::exception& e) {
    throw util::DependencyUnavailable(std::string("sqlite cache ") + op + " failed: " + e.what());
  }
}

} // namespace

SqliteCache::SqliteCache(std::shared_ptr<db::sqlite::SqliteDB> db) : SqliteCache(std::move(db), &util::Now) {
}

SqliteCache::SqliteCache(std::shared_ptr<db::sqlite::SqliteDB> db, ClockFn clock) : db_(std::move(db)), clock_(std::move(clock)) {
  db_->Exec(sql::CREATE_CACHE_ENTRIES);
}

uint64_t SqliteCache::NowMs() const {
  return util::ToUnixMillis(clock_());
}

std::optional<uint64_t> SqliteCache::ExpiresAtMs(Ttl ttl) const {
  if (!ttl) return std::nullopt;
  return NowMs() + static_cast<uint64_t>(ttl->count());
}

std::optional<std::string> SqliteCache::ReadLocked(const std::string& key, uint64_t now_ms) {
  auto st = db_->Prepare(sql::SELECT_CACHE_ENTRY);
  BindText(st.get(), 1, key);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) throw std::runtime_error(std::string("select cache entry: ") + sqlite3_errmsg(db_->Handle()));

  if (sqlite3_column_type(st.get(), 1) != SQLITE_NULL) {
    const auto expires_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 1));
    if (expires_at_ms <= now_ms) return std::nullopt;
  }

  const auto* data = static_cast<const char*>(sqlite3_column_blob(st.get(), 0));
  const int   size = sqlite3_column_bytes(st.get(), 0);
  return data ? std::string(data, static_cast<std::size_t>(size)) : std::string();
}

bool SqliteCache::Exists(const std::string& key) {
  return Read(key).has_value();
}

std::optional<std::string> SqliteCache::Read(const std::string& key) {
  return Guarded("read", [&] {
    std::lock_guard lock(db_->Mutex());
    return ReadLocked(key, NowMs());
  });
}

void SqliteCache::Write(const std::string& key, const std::string& value, Ttl ttl) {
  Guarded("write", [&] {
    std::lock_guard lock(db_->Mutex());
    auto            st = db_->Prepare(sql::UPSERT_CACHE_ENTRY);
    BindText(st.get(), 1, key);
    BindBlob(st.get(), 2, value);
    BindExpiry(st.get(), 3, ExpiresAtMs(ttl));
    StepDone(st.get(), db_->Handle(), "upsert cache entry");
  });
}

bool SqliteCache::WriteIfAbsent(const std::string& key, const std::string& value, Ttl ttl) {
  return Guarded("write-if-absent", [&] {
    std::lock_guard   lock(db_->Mutex());
    SqliteTransaction tx(db_);

    const auto now_ms = NowMs();
    {
      auto purge = db_->Prepare(sql::DELETE_EXPIRED_CACHE_ENTRY);
      BindText(purge.get(), 1, key);
      sqlite3_bind_int64(purge.get(), 2, static_cast<sqlite3_int64>(now_ms));
      StepDone(purge.get(), db_->Handle(), "purge expired cache entry");
    }

    auto insert = db_->Prepare(sql::INSERT_CACHE_ENTRY_IF_ABSENT);
    BindText(insert.get(), 1, key);
    BindBlob(insert.get(), 2, value);
    BindExpiry(insert.get(), 3, ExpiresAtMs(ttl));
    StepDone(insert.get(), db_->Handle(), "insert cache entry");

    const bool stored = sqlite3_changes(db_->Handle()) == 1;
    tx.Commit();
    return stored;
  });
}

std::optional<int64_t> SqliteCache::Increment(const std::string& key, int64_t delta) {
  return Guarded("increment", [&]() -> std::optional<int64_t> {
    std::lock_guard   lock(db_->Mutex());
    SqliteTransaction tx(db_);

    auto raw = ReadLocked(key, NowMs());
    if (!raw) {
      tx.Rollback();
      return std::nullopt;
    }

    int64_t     current = 0;
    const auto* end     = raw->data() + raw->size();
    auto [ptr, ec]      = std::from_chars(raw->data(), end, current);
    if (ec != std::errc() || ptr != end) {
      throw util::DependencyUnavailable("cache value at '" + key + "' is not an integer");
    }

    const int64_t next = current + delta;
    auto          st   = db_->Prepare(sql::UPDATE_CACHE_VALUE);
    BindBlob(st.get(), 1, std::to_string(next));
    BindText(st.get(), 2, key);
    StepDone(st.get(), db_->Handle(), "update cache value");

    tx.Commit();
    return next;
  });
}

void SqliteCache::Delete(const std::string& key) {
  Guarded("delete", [&] {
    std::lock_guard lock(db_->Mutex());
    auto            st = db_->Prepare(sql::DELETE_CACHE_ENTRY);
    BindText(st.get(), 1, key);
    StepDone(st.get(), db_->Handle(), "delete cache entry");
  });
}

void SqliteCache::Clear() {
  Guarded("clear", [&] {
    std::lock_guard lock(db_->Mutex());
    db_->Exec(sql::DELETE_ALL_CACHE_ENTRIES);
  });
}

} // namespace shortener::cache::sqlite
