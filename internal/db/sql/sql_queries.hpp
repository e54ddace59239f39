#pragma once

namespace shortener::db::sql {

/*
  Canonical SQL for the SQLite backends.

  Postgres prepares its own $n-parameter variants in PgPool.
*/

// schema

static constexpr const char* CREATE_LINKS =
    "CREATE TABLE IF NOT EXISTS links ("
    " id INTEGER PRIMARY KEY AUTOINCREMENT,"
    " original_url TEXT NOT NULL,"
    " short_code TEXT NOT NULL,"
    " created_at_ms INTEGER NOT NULL);";

static constexpr const char* CREATE_LINKS_SHORT_CODE_INDEX =
    "CREATE UNIQUE INDEX IF NOT EXISTS index_links_on_short_code ON links(short_code);";

static constexpr const char* CREATE_CACHE_ENTRIES =
    "CREATE TABLE IF NOT EXISTS cache_entries ("
    " key TEXT PRIMARY KEY,"
    " value BLOB NOT NULL,"
    " expires_at_ms INTEGER);";

// links

static constexpr const char* INSERT_LINK =
    "INSERT INTO links(original_url,short_code,created_at_ms)"
    " VALUES(?,?,?);";

static constexpr const char* SELECT_LINK_BY_SHORT_CODE =
    "SELECT id,original_url,short_code,created_at_ms"
    " FROM links WHERE short_code=?;";

static constexpr const char* COUNT_LINKS =
    "SELECT COUNT(*) FROM links;";

static constexpr const char* SELECT_RECENT_SHORT_CODES =
    "SELECT short_code FROM links ORDER BY id DESC LIMIT ?;";

// cache entries

static constexpr const char* SELECT_CACHE_ENTRY =
    "SELECT value,expires_at_ms FROM cache_entries WHERE key=?;";

static constexpr const char* UPSERT_CACHE_ENTRY =
    "INSERT INTO cache_entries(key,value,expires_at_ms)"
    " VALUES(?,?,?)"
    " ON CONFLICT(key) DO UPDATE SET"
    " value=excluded.value,"
    " expires_at_ms=excluded.expires_at_ms;";

static constexpr const char* INSERT_CACHE_ENTRY_IF_ABSENT =
    "INSERT OR IGNORE INTO cache_entries(key,value,expires_at_ms)"
    " VALUES(?,?,?);";

static constexpr const char* DELETE_EXPIRED_CACHE_ENTRY =
    "DELETE FROM cache_entries"
    " WHERE key=? AND expires_at_ms IS NOT NULL AND expires_at_ms<=?;";

static constexpr const char* UPDATE_CACHE_VALUE =
    "UPDATE cache_entries SET value=? WHERE key=?;";

static constexpr const char* DELETE_CACHE_ENTRY =
    "DELETE FROM cache_entries WHERE key=?;";

static constexpr const char* DELETE_ALL_CACHE_ENTRIES =
    "DELETE FROM cache_entries;";

} // namespace shortener::db::sql
