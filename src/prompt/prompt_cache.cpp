#include "injguard/prompt/prompt_cache.h"

namespace injguard::prompt {

std::optional<std::string> PromptCache::find(const std::string& cache_key) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = entries_.find(cache_key);
  if (it == entries_.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::string PromptCache::insert(const std::string& cache_key, std::string text) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto [it, inserted] = entries_.try_emplace(cache_key, std::move(text));
  return it->second;
}

std::size_t PromptCache::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

}  // namespace injguard::prompt
