#pragma once

#include <string>

namespace injguard::core {

// IClock supplies audit timestamps. Injected so tests and replays get stable output.
class IClock {
 public:
  virtual ~IClock() = default;

  // Current time as ISO 8601 UTC, e.g. "2026-01-01T00:00:00Z". Never empty.
  virtual std::string now_iso8601() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

class SystemClock final : public IClock {
 public:
  std::string now_iso8601() override;
};

// FixedClock always reports the same instant.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::string instant) : instant_(std::move(instant)) {}

  std::string now_iso8601() override { return instant_; }

 private:
  std::string instant_;
};

}  // namespace injguard::core
