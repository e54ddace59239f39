#include "sqlite_repository.hpp"

#include <chrono>
#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace shortener::db::sqlite {

using shortener::db::ErrorCode;
using shortener::db::Result;

namespace {

uint64_t NowMs() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count());
}

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

void SqliteRepository::BootstrapSchema(SqliteDB& db) {
    db.Exec(sql::CREATE_LINKS);
    db.Exec(sql::CREATE_LINKS_SHORT_CODE_INDEX);
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xFF) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Links
// ------------------------------------------------------------------

Result SqliteRepository::InsertLink(Transaction& t, model::LinkRecord& r) {
    auto& tx = TX(t);
    auto* db = tx.Handle();

    if (r.created_at_ms == 0) r.created_at_ms = NowMs();

    sqlite3_stmt* raw = nullptr;
    if (sqlite3_prepare_v2(db, sql::INSERT_LINK, -1, &raw, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    StatementPtr st(raw, &sqlite3_finalize);

    BindText(st.get(), 1, r.original_url);
    BindText(st.get(), 2, r.short_code);
    BindU64(st.get(), 3, r.created_at_ms);

    const int rc = sqlite3_step(st.get());
    auto result = Translate(db, rc);
    if (result) r.id = static_cast<int64_t>(sqlite3_last_insert_rowid(db));
    return result;
}

std::optional<model::LinkRecord>
SqliteRepository::FindLinkByShortCode(Transaction& t, const std::string& short_code) {
    auto st = TX(t).DB().Prepare(sql::SELECT_LINK_BY_SHORT_CODE);
    BindText(st.get(), 1, short_code);

    const int rc = sqlite3_step(st.get());
    if (rc == SQLITE_DONE) return std::nullopt;
    if (rc != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite select link: ") + sqlite3_errmsg(TX(t).Handle()));

    model::LinkRecord r;
    r.id = static_cast<int64_t>(sqlite3_column_int64(st.get(), 0));
    r.original_url = ColText(st.get(), 1);
    r.short_code = ColText(st.get(), 2);
    r.created_at_ms = static_cast<uint64_t>(sqlite3_column_int64(st.get(), 3));
    return r;
}

uint64_t SqliteRepository::CountLinks(Transaction& t) {
    auto st = TX(t).DB().Prepare(sql::COUNT_LINKS);
    if (sqlite3_step(st.get()) != SQLITE_ROW)
        throw std::runtime_error(std::string("sqlite count links: ") + sqlite3_errmsg(TX(t).Handle()));
    return static_cast<uint64_t>(sqlite3_column_int64(st.get(), 0));
}

std::vector<std::string> SqliteRepository::RecentShortCodes(Transaction& t, std::size_t limit) {
    auto st = TX(t).DB().Prepare(sql::SELECT_RECENT_SHORT_CODES);
    BindU64(st.get(), 1, limit);

    std::vector<std::string> codes;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) codes.push_back(ColText(st.get(), 0));
    if (rc != SQLITE_DONE)
        throw std::runtime_error(std::string("sqlite recent short codes: ") + sqlite3_errmsg(TX(t).Handle()));
    return codes;
}

} // namespace shortener::db::sqlite
