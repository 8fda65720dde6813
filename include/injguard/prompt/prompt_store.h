#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <utility>

namespace injguard::prompt {

// IPromptStore is the remote object storage holding optional template overrides.
//
// Contract:
// - get_object returns the object body, or nullopt when (bucket, key) does not exist.
// - Any other backend failure (unreachable, permission, corrupt read) throws
//   core::TransportError. Callers do not retry.
class IPromptStore {
 public:
  virtual ~IPromptStore() = default;

  [[nodiscard]] virtual std::optional<std::string> get_object(const std::string& bucket,
                                                              const std::string& key) = 0;

  // Short backend description for startup diagnostics.
  [[nodiscard]] virtual std::string describe() const = 0;
};

// InMemoryPromptStore holds objects in a map. Counts fetches so tests can assert that
// cache hits and rejected keys never reach the store.
class InMemoryPromptStore final : public IPromptStore {
 public:
  void put_object(const std::string& bucket, const std::string& key, std::string body);

  [[nodiscard]] std::optional<std::string> get_object(const std::string& bucket,
                                                      const std::string& key) override;
  [[nodiscard]] std::string describe() const override { return "in-memory"; }

  [[nodiscard]] std::size_t fetch_count() const { return fetch_count_; }

 private:
  std::map<std::pair<std::string, std::string>, std::string> objects_;
  std::size_t fetch_count_{0};
};

// FilesystemPromptStore maps (bucket, key) to <root>/<bucket>/<key>.
// Keys reaching it have already passed validate_prompt_override_key (no "..").
class FilesystemPromptStore final : public IPromptStore {
 public:
  explicit FilesystemPromptStore(std::filesystem::path root);

  [[nodiscard]] std::optional<std::string> get_object(const std::string& bucket,
                                                      const std::string& key) override;
  [[nodiscard]] std::string describe() const override;

 private:
  std::filesystem::path root_;
};

}  // namespace injguard::prompt
