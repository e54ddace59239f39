#pragma once

#include <functional>
#include <memory>
#include <mutex>

#include "internal/cache/cache_store.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/util/time.hpp"

namespace shortener::cache::sqlite {

/*
  Cache tier backed by a SQLite file.

  Every server process on a host pointing at the same file shares the
  counter. Read-modify-write operations run under BEGIN IMMEDIATE, which
  SQLite serializes across processes; the connection mutex serializes
  threads sharing the one connection.
*/
class SqliteCache final : public CacheStore {
 public:
  using ClockFn = std::function<util::TimePoint()>;

  explicit SqliteCache(std::shared_ptr<db::sqlite::SqliteDB> db);
  SqliteCache(std::shared_ptr<db::sqlite::SqliteDB> db, ClockFn clock);

  bool                       Exists(const std::string& key) override;
  std::optional<std::string> Read(const std::string& key) override;
  void                       Write(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  bool                       WriteIfAbsent(const std::string& key, const std::string& value, Ttl ttl = std::nullopt) override;
  std::optional<int64_t>     Increment(const std::string& key, int64_t delta = 1) override;
  void                       Delete(const std::string& key) override;
  void                       Clear() override;

 private:
  std::optional<std::string> ReadLocked(const std::string& key, uint64_t now_ms);
  std::optional<uint64_t>    ExpiresAtMs(Ttl ttl) const;
  uint64_t                   NowMs() const;

  std::shared_ptr<db::sqlite::SqliteDB> db_;
  ClockFn                               clock_;
};

} // namespace shortener::cache::sqlite
