#pragma once

#include <cstddef>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace injguard::prompt {

// Cache key under which the built-in template is memoised. Valid override keys must start
// with kRequiredKeyPrefix, so this can never collide with one.
constexpr const char* kDefaultTemplateCacheKey = "<default>";

// PromptCache memoises loaded templates for the lifetime of the process (or worker) that
// owns it. It is created by the composition root and passed explicitly to PromptSource;
// the validator and assembler never see it.
//
// Entries are immutable: the first insert for a key wins, later inserts are ignored and
// nothing is ever evicted or refreshed. Since a given key always loads the same text,
// racing inserts cost at most a redundant fetch, never a wrong value.
class PromptCache {
 public:
  PromptCache() = default;
  ~PromptCache() = default;

  PromptCache(const PromptCache&) = delete;
  PromptCache& operator=(const PromptCache&) = delete;
  PromptCache(PromptCache&&) = delete;
  PromptCache& operator=(PromptCache&&) = delete;

  [[nodiscard]] std::optional<std::string> find(const std::string& cache_key) const;

  // Returns the cached text for `cache_key` after the insert (the existing entry if any).
  std::string insert(const std::string& cache_key, std::string text);

  [[nodiscard]] std::size_t size() const;

 private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> entries_;
};

}  // namespace injguard::prompt
