#pragma once

#include "injguard/core/result.h"

#include <memory>
#include <string>

// Forward declare sqlite3 to avoid exposing SQLite header in public API
struct sqlite3;
struct sqlite3_stmt;

namespace injguard::storage::sqlite {

// Milliseconds a connection waits on a locked database before failing a statement.
// The server and one-shot CLI runs may share one audit file.
constexpr int kBusyTimeoutMs = 5000;

// SqliteDb owns one SQLite connection and the audit schema.
// - RAII: connection managed via unique_ptr with custom deleter
// - Local failures are returned as Result<T, std::string>, never thrown
// - One connection per instance; callers serialize access
class SqliteDb {
 public:
  // Open or create database at path. ":memory:" creates an in-memory database.
  [[nodiscard]] static core::Result<std::shared_ptr<SqliteDb>, std::string> open(
      const std::string& path);

  ~SqliteDb() = default;

  SqliteDb(const SqliteDb&) = delete;
  SqliteDb& operator=(const SqliteDb&) = delete;
  SqliteDb(SqliteDb&&) = delete;
  SqliteDb& operator=(SqliteDb&&) = delete;

  // Highest applied schema version, 0 on a fresh database.
  [[nodiscard]] int get_schema_version() const;

  // Applies schema v1 (audit_events) in one transaction. No-op when already applied.
  [[nodiscard]] core::Result<bool, std::string> ensure_schema_v1();

  [[nodiscard]] core::Result<bool, std::string> exec(const std::string& sql);

  // Raw connection for prepared statements. Store implementations only.
  [[nodiscard]] sqlite3* connection() const { return db_.get(); }

 private:
  struct SqliteDeleter {
    void operator()(sqlite3* db) const;
  };

  explicit SqliteDb(sqlite3* db);

  std::unique_ptr<sqlite3, SqliteDeleter> db_;
};

// Statement owns one prepared statement. Bind indices are 1-based, column indices 0-based.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql);
  ~Statement() = default;

  Statement(const Statement&) = delete;
  Statement& operator=(const Statement&) = delete;
  Statement(Statement&&) = delete;
  Statement& operator=(Statement&&) = delete;

  [[nodiscard]] bool is_valid() const { return stmt_ != nullptr; }
  [[nodiscard]] const std::string& error() const { return error_; }

  void bind_text(int index, const std::string& value);
  void bind_int(int index, int value);

  // True while a row is available.
  [[nodiscard]] bool next_row();
  // True when a write statement ran to completion; otherwise error() explains.
  [[nodiscard]] bool run();

  [[nodiscard]] std::string column_text(int col) const;
  [[nodiscard]] bool column_is_null(int col) const;
  [[nodiscard]] int column_int(int col) const;

 private:
  struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const;
  };

  sqlite3* db_;
  std::unique_ptr<sqlite3_stmt, StmtDeleter> stmt_;
  std::string error_;
};

}  // namespace injguard::storage::sqlite
