#pragma once

#include "injguard/storage/audit_event.h"

#include <mutex>
#include <string>
#include <vector>

namespace injguard::storage {

// IAuditLog is the append-only record of what each classification did.
// query returns a trace's events in append order; an empty trace_id returns every event.
class IAuditLog {
 public:
  virtual ~IAuditLog() = default;
  virtual void append(const AuditEvent& event) = 0;
  [[nodiscard]] virtual std::vector<AuditEvent> query(const std::string& trace_id) const = 0;
};

class InMemoryAuditLog final : public IAuditLog {
 public:
  void append(const AuditEvent& event) override;
  [[nodiscard]] std::vector<AuditEvent> query(const std::string& trace_id) const override;

 private:
  mutable std::mutex mutex_;
  std::vector<AuditEvent> events_;
};

}  // namespace injguard::storage
