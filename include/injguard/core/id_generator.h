#pragma once

#include <atomic>
#include <string>
#include <string_view>

namespace injguard::core {

// IIdGenerator mints trace and audit event identifiers of the form "<prefix>-...".
class IIdGenerator {
 public:
  virtual ~IIdGenerator() = default;

  virtual std::string next(std::string_view prefix) = 0;

 protected:
  IIdGenerator() = default;
  IIdGenerator(const IIdGenerator&) = default;
  IIdGenerator& operator=(const IIdGenerator&) = default;
  IIdGenerator(IIdGenerator&&) = default;
  IIdGenerator& operator=(IIdGenerator&&) = default;
};

// "<prefix>-<epoch micros>-<sequence>". Unique within the process; thread-safe.
class SystemIdGenerator final : public IIdGenerator {
 public:
  SystemIdGenerator() = default;
  SystemIdGenerator(const SystemIdGenerator&) = delete;
  SystemIdGenerator& operator=(const SystemIdGenerator&) = delete;
  SystemIdGenerator(SystemIdGenerator&&) = delete;
  SystemIdGenerator& operator=(SystemIdGenerator&&) = delete;
  ~SystemIdGenerator() override = default;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

// "<prefix>-<sequence>". Reproducible across runs; used by tests.
class SequentialIdGenerator final : public IIdGenerator {
 public:
  SequentialIdGenerator() = default;
  SequentialIdGenerator(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator& operator=(const SequentialIdGenerator&) = delete;
  SequentialIdGenerator(SequentialIdGenerator&&) = delete;
  SequentialIdGenerator& operator=(SequentialIdGenerator&&) = delete;
  ~SequentialIdGenerator() override = default;

  std::string next(std::string_view prefix) override;

 private:
  std::atomic<unsigned long long> sequence_{0};
};

}  // namespace injguard::core
