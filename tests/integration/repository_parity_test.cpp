#include <cassert>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/codec/base62.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/link_record.hpp"

#if SHORTENER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if SHORTENER_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using shortener::db::ErrorCode;
using shortener::db::Repository;
using shortener::db::memory::MemoryRepository;
using shortener::db::model::LinkRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Postgres keeps rows across runs; derive codes from the clock so reruns do not collide.
std::string Code(char prefix) {
  const auto stamp = *shortener::codec::Encode(static_cast<int64_t>(NowMs()));
  return prefix + stamp.substr(stamp.size() - 5);
}

void VerifyInsertFind(Repository& repo, const std::string& code) {
  auto tx = repo.Begin();

  LinkRecord link;
  link.original_url = "https://example.com/" + code;
  link.short_code   = code;

  auto insert = repo.InsertLink(*tx, link);
  assert(insert);
  assert(link.id > 0);
  assert(link.created_at_ms > 0);

  // reads inside the transaction see its writes
  auto found = repo.FindLinkByShortCode(*tx, code);
  assert(found.has_value());
  assert(found->id == link.id);
  assert(found->original_url == link.original_url);
  assert(!tx->IsCommitted());
  tx->Commit();
  assert(tx->IsCommitted());

  auto read_tx = repo.Begin();
  auto committed = repo.FindLinkByShortCode(*read_tx, code);
  assert(committed.has_value());
  assert(committed->created_at_ms == link.created_at_ms);
  assert(!repo.FindLinkByShortCode(*read_tx, "ZZZZZZ").has_value());
  read_tx->Commit();
}

void VerifyDuplicateIsConstraintViolation(Repository& repo, const std::string& code) {
  {
    auto       tx = repo.Begin();
    LinkRecord first{.id = 0, .original_url = "https://example.com/first", .short_code = code, .created_at_ms = 0};
    assert(repo.InsertLink(*tx, first));
    tx->Commit();
  }

  auto       tx = repo.Begin();
  LinkRecord second{.id = 0, .original_url = "https://example.com/second", .short_code = code, .created_at_ms = 0};
  auto       result = repo.InsertLink(*tx, second);
  assert(!result);
  assert(result.code == ErrorCode::ConstraintViolation);
  tx->Rollback();
  assert(!tx->IsCommitted());

  auto verify = repo.Begin();
  assert(repo.FindLinkByShortCode(*verify, code)->original_url == "https://example.com/first");
  verify->Commit();
}

void VerifyRollbackBehavior(Repository& repo, const std::string& code) {
  const auto before = [&]() {
    auto tx    = repo.Begin();
    auto count = repo.CountLinks(*tx);
    tx->Commit();
    return count;
  }();

  {
    auto       tx = repo.Begin();
    LinkRecord link{.id = 0, .original_url = "https://example.com/rollback", .short_code = code, .created_at_ms = NowMs()};
    assert(repo.InsertLink(*tx, link));
    assert(repo.CountLinks(*tx) == before + 1);
    tx->Rollback();
  }

  {
    // destroyed without commit
    auto       tx = repo.Begin();
    LinkRecord link{.id = 0, .original_url = "https://example.com/dropped", .short_code = code, .created_at_ms = NowMs()};
    assert(repo.InsertLink(*tx, link));
  }

  auto tx = repo.Begin();
  assert(!repo.FindLinkByShortCode(*tx, code).has_value());
  assert(repo.CountLinks(*tx) == before);
  tx->Commit();
}

void VerifyCommittedCodeBlocksLaterTransaction(Repository& repo, const std::string& code, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  LinkRecord a{.id = 0, .original_url = "https://example.com/a", .short_code = code, .created_at_ms = 0};
  assert(repo.InsertLink(*tx1, a));
  tx1->Commit();

  auto       tx2 = repo.Begin();
  LinkRecord b{.id = 0, .original_url = "https://example.com/b", .short_code = code, .created_at_ms = 0};
  auto       result = repo.InsertLink(*tx2, b);
  assert(result.code == ErrorCode::ConstraintViolation);
  tx2->Rollback();
}

void VerifyRecentShortCodesNewestFirst(Repository& repo, char prefix) {
  const std::string base = Code(prefix);
  std::vector<std::string> inserted;
  for (char suffix : {'R', 'O', '9'}) {
    auto       tx = repo.Begin();
    LinkRecord link{.id = 0, .original_url = "https://example.com/recent", .short_code = base.substr(0, 5) + suffix, .created_at_ms = 0};
    assert(repo.InsertLink(*tx, link));
    tx->Commit();
    inserted.push_back(link.short_code);
  }

  auto tx     = repo.Begin();
  auto recent = repo.RecentShortCodes(*tx, 2);
  assert(recent.size() == 2);
  assert(recent[0] == inserted[2]);
  assert(recent[1] == inserted[1]);

  // uncommitted inserts are visible to their own transaction
  LinkRecord pending{.id = 0, .original_url = "https://example.com/pending", .short_code = base.substr(0, 5) + 'z', .created_at_ms = 0};
  assert(repo.InsertLink(*tx, pending));
  assert(repo.RecentShortCodes(*tx, 1).front() == pending.short_code);
  tx->Rollback();

  auto after = repo.Begin();
  assert(repo.RecentShortCodes(*after, 1).front() == inserted[2]);
  after->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& code) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto       tx = repo->Begin();
    LinkRecord link{.id = 0, .original_url = "https://example.com/durable", .short_code = code, .created_at_ms = 1'650'000'000'000};
    assert(repo->InsertLink(*tx, link));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto l  = repo->FindLinkByShortCode(*tx, code);
  assert(l.has_value());
  assert(l->original_url == "https://example.com/durable");
  assert(l->created_at_ms == 1'650'000'000'000);
  tx->Commit();

  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if SHORTENER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("shortener_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() {
    auto db = std::make_shared<shortener::db::sqlite::SqliteDB>(db_path);
    shortener::db::sqlite::SqliteRepository::BootstrapSchema(*db);
    return std::make_shared<shortener::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup =
          [db_path]() {
            std::filesystem::remove(db_path);
            std::filesystem::remove(db_path + "-wal");
            std::filesystem::remove(db_path + "-shm");
          },
      .supports_parallel_transactions = false,
  };
}
#endif

#if SHORTENER_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("SHORTENER_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("SHORTENER_TEST_POSTGRES_URI is not set");
  }

  auto conninfo  = std::string(uri);
  auto make_repo = [conninfo]() {
    auto pool = std::make_shared<shortener::db::postgres::PgPool>(conninfo);
    shortener::db::postgres::PgRepository::BootstrapSchema(*pool);
    return std::make_shared<shortener::db::postgres::PgRepository>(std::move(pool));
  };

  return BackendFactory{
      .name                           = "postgres",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertFind(*repo, Code('a'));
  VerifyDuplicateIsConstraintViolation(*repo, Code('b'));
  VerifyRollbackBehavior(*repo, Code('c'));
  VerifyCommittedCodeBlocksLaterTransaction(*repo, Code('d'), backend.supports_parallel_transactions);
  VerifyRecentShortCodesNewestFirst(*repo, 'f');

  VerifyRestartDurability(backend, Code('e'));

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if SHORTENER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

#if SHORTENER_DB_POSTGRES
  try {
    backends.push_back(MakePostgresFactory());
  } catch (const std::exception& ex) {
    std::cout << "skipping postgres integration suite: " << ex.what() << "\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "shortener_integration_repository_parity: pass\n";
  return 0;
}
