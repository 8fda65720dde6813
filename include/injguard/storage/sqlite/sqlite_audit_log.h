#pragma once

#ifdef INJGUARD_TRANSPORT_BOUNDARY_GUARD
#error "Concrete storage header included in a guarded translation unit — use IAuditLog only."
#endif

#include "injguard/storage/audit_log.h"
#include "injguard/storage/sqlite/sqlite_db.h"

#include <map>
#include <memory>
#include <mutex>

namespace injguard::storage::sqlite {

// SqliteAuditLog implements IAuditLog on the audit_events table.
// Per-trace order is kept in the idx column; the counter is seeded from MAX(idx) the first
// time a trace is seen, so traces resumed after a restart keep appending in order.
//
// The audit log is observability, not part of the verdict: a failed write is reported on
// stderr and does not interrupt the classification that produced it.
class SqliteAuditLog final : public IAuditLog {
 public:
  // Requires ensure_schema_v1() to have succeeded on db.
  explicit SqliteAuditLog(std::shared_ptr<SqliteDb> db);

  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  [[nodiscard]] int next_index(const std::string& trace_id);

  std::shared_ptr<SqliteDb> db_;
  mutable std::mutex mutex_;
  std::map<std::string, int> trace_indices_;
};

}  // namespace injguard::storage::sqlite
