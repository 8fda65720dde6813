#include "injguard/storage/sqlite/sqlite_db.h"

#include <sqlite3.h>

namespace injguard::storage::sqlite {

namespace {

using BoolResult = core::Result<bool, std::string>;

constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS schema_version (
  version INTEGER PRIMARY KEY,
  applied_at TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS audit_events (
  event_id TEXT PRIMARY KEY,
  trace_id TEXT NOT NULL,
  event_type TEXT NOT NULL,
  payload TEXT NOT NULL,
  created_at TEXT NOT NULL,
  refs_json TEXT NOT NULL,
  idx INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_audit_events_trace ON audit_events(trace_id, idx);

INSERT OR IGNORE INTO schema_version (version, applied_at)
VALUES (1, strftime('%Y-%m-%dT%H:%M:%SZ', 'now'));
)";

}  // namespace

void SqliteDb::SqliteDeleter::operator()(sqlite3* db) const {
  if (db != nullptr) {
    sqlite3_close(db);
  }
}

SqliteDb::SqliteDb(sqlite3* db) : db_(db) {}

core::Result<std::shared_ptr<SqliteDb>, std::string> SqliteDb::open(const std::string& path) {
  using OpenResult = core::Result<std::shared_ptr<SqliteDb>, std::string>;

  sqlite3* raw = nullptr;
  const int rc =
      sqlite3_open_v2(path.c_str(), &raw, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
  // sqlite3_open_v2 hands back a handle even on failure; it must still be closed.
  std::unique_ptr<sqlite3, SqliteDeleter> guard(raw);
  if (rc != SQLITE_OK) {
    const std::string error = raw != nullptr ? sqlite3_errmsg(raw) : "out of memory";
    return OpenResult::err("Failed to open database '" + path + "': " + error);
  }

  sqlite3_busy_timeout(raw, kBusyTimeoutMs);
  return OpenResult::ok(std::shared_ptr<SqliteDb>(new SqliteDb(guard.release())));
}

int SqliteDb::get_schema_version() const {
  Statement stmt(db_.get(), "SELECT MAX(version) FROM schema_version");
  if (!stmt.is_valid() || !stmt.next_row() || stmt.column_is_null(0)) {
    return 0;  // fresh database: no schema_version table or no rows
  }
  return stmt.column_int(0);
}

BoolResult SqliteDb::ensure_schema_v1() {
  if (get_schema_version() >= 1) {
    return BoolResult::ok(true);
  }

  if (auto begun = exec("BEGIN IMMEDIATE"); !begun.has_value()) {
    return BoolResult::err("Failed to apply schema v1: " + begun.error());
  }

  auto applied = exec(kSchemaV1);
  if (!applied.has_value()) {
    (void)exec("ROLLBACK");
    return BoolResult::err("Failed to apply schema v1: " + applied.error());
  }

  if (auto committed = exec("COMMIT"); !committed.has_value()) {
    (void)exec("ROLLBACK");
    return BoolResult::err("Failed to apply schema v1: " + committed.error());
  }
  return BoolResult::ok(true);
}

BoolResult SqliteDb::exec(const std::string& sql) {
  char* err_msg = nullptr;
  const int rc = sqlite3_exec(db_.get(), sql.c_str(), nullptr, nullptr, &err_msg);
  if (rc != SQLITE_OK) {
    std::string error = err_msg != nullptr ? err_msg : sqlite3_errstr(rc);
    sqlite3_free(err_msg);
    return BoolResult::err("SQL execution failed: " + error);
  }
  return BoolResult::ok(true);
}

// ── Statement ────────────────────────────────────────────────────────────────

void Statement::StmtDeleter::operator()(sqlite3_stmt* stmt) const {
  if (stmt != nullptr) {
    sqlite3_finalize(stmt);
  }
}

Statement::Statement(sqlite3* db, const std::string& sql) : db_(db) {
  sqlite3_stmt* raw = nullptr;
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &raw, nullptr) != SQLITE_OK) {
    error_ = sqlite3_errmsg(db);
    sqlite3_finalize(raw);
    return;
  }
  stmt_.reset(raw);
}

void Statement::bind_text(const int index, const std::string& value) {
  sqlite3_bind_text(stmt_.get(), index, value.c_str(), static_cast<int>(value.size()),
                    SQLITE_TRANSIENT);
}

void Statement::bind_int(const int index, const int value) {
  sqlite3_bind_int(stmt_.get(), index, value);
}

bool Statement::next_row() {
  return sqlite3_step(stmt_.get()) == SQLITE_ROW;
}

bool Statement::run() {
  if (sqlite3_step(stmt_.get()) == SQLITE_DONE) {
    return true;
  }
  error_ = sqlite3_errmsg(db_);
  return false;
}

std::string Statement::column_text(const int col) const {
  const auto* raw = sqlite3_column_text(stmt_.get(), col);
  if (raw == nullptr) {
    return {};
  }
  const int len = sqlite3_column_bytes(stmt_.get(), col);
  return {reinterpret_cast<const char*>(raw),  // NOLINT(cppcoreguidelines-pro-type-reinterpret-cast)
          static_cast<std::size_t>(len)};
}

bool Statement::column_is_null(const int col) const {
  return sqlite3_column_type(stmt_.get(), col) == SQLITE_NULL;
}

int Statement::column_int(const int col) const {
  return sqlite3_column_int(stmt_.get(), col);
}

}  // namespace injguard::storage::sqlite
