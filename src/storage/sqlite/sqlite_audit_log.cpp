#include "injguard/storage/sqlite/sqlite_audit_log.h"

#include <nlohmann/json.hpp>

#include <iostream>

namespace injguard::storage::sqlite {

namespace {

constexpr const char* kInsertEvent = R"(
  INSERT INTO audit_events
    (event_id, trace_id, event_type, payload, created_at, refs_json, idx)
  VALUES (?, ?, ?, ?, ?, ?, ?)
)";

constexpr const char* kSelectColumns =
    "SELECT event_id, trace_id, event_type, payload, created_at, refs_json FROM audit_events";

std::vector<std::string> decode_refs(const std::string& text) {
  std::vector<std::string> refs;
  const auto parsed = nlohmann::json::parse(text, nullptr, false);
  if (!parsed.is_array()) {
    return refs;
  }
  for (const auto& ref : parsed) {
    if (ref.is_string()) {
      refs.push_back(ref.get<std::string>());
    }
  }
  return refs;
}

AuditEvent read_event(const Statement& stmt) {
  AuditEvent event;
  event.event_id = stmt.column_text(0);
  event.trace_id = stmt.column_text(1);
  event.event_type = stmt.column_text(2);
  event.payload = stmt.column_text(3);
  event.created_at = stmt.column_text(4);
  event.refs = decode_refs(stmt.column_text(5));
  return event;
}

}  // namespace

SqliteAuditLog::SqliteAuditLog(std::shared_ptr<SqliteDb> db) : db_(std::move(db)) {}

void SqliteAuditLog::append(const AuditEvent& event) {
  std::lock_guard<std::mutex> lock(mutex_);

  Statement insert(db_->connection(), kInsertEvent);
  if (!insert.is_valid()) {
    std::cerr << "WARNING: audit append failed (" << event.event_type << "): " << insert.error()
              << "\n";
    return;
  }

  insert.bind_text(1, event.event_id);
  insert.bind_text(2, event.trace_id);
  insert.bind_text(3, event.event_type);
  insert.bind_text(4, event.payload);
  insert.bind_text(5, event.created_at);
  insert.bind_text(6, nlohmann::json(event.refs).dump());
  insert.bind_int(7, next_index(event.trace_id));

  if (!insert.run()) {
    std::cerr << "WARNING: audit append failed (" << event.event_type << "): " << insert.error()
              << "\n";
  }
}

std::vector<AuditEvent> SqliteAuditLog::query(const std::string& trace_id) const {
  std::lock_guard<std::mutex> lock(mutex_);

  const bool all = trace_id.empty();
  const std::string sql = std::string(kSelectColumns) +
                          (all ? " ORDER BY rowid" : " WHERE trace_id = ? ORDER BY idx");

  Statement select(db_->connection(), sql);
  if (!select.is_valid()) {
    std::cerr << "WARNING: audit query failed: " << select.error() << "\n";
    return {};
  }
  if (!all) {
    select.bind_text(1, trace_id);
  }

  std::vector<AuditEvent> events;
  while (select.next_row()) {
    events.push_back(read_event(select));
  }
  return events;
}

int SqliteAuditLog::next_index(const std::string& trace_id) {
  if (auto it = trace_indices_.find(trace_id); it != trace_indices_.end()) {
    return it->second++;
  }

  // First sight of this trace in this process: continue after whatever is on disk.
  int idx = 0;
  Statement max_idx(db_->connection(), "SELECT MAX(idx) FROM audit_events WHERE trace_id = ?");
  if (max_idx.is_valid()) {
    max_idx.bind_text(1, trace_id);
    if (max_idx.next_row() && !max_idx.column_is_null(0)) {
      idx = max_idx.column_int(0) + 1;
    }
  }

  trace_indices_[trace_id] = idx + 1;
  return idx;
}

}  // namespace injguard::storage::sqlite
