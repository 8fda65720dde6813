#pragma once

#include "injguard/prompt/prompt_cache.h"
#include "injguard/prompt/prompt_store.h"

#include <optional>
#include <string>

namespace injguard::prompt {

// PromptSource supplies the instruction template for a request.
//
// It borrows the store and the cache; both must outlive it. The cache is the process-
// lifetime memo described in prompt_cache.h.
class PromptSource {
 public:
  PromptSource(IPromptStore& store, PromptCache& cache, std::string bucket,
               std::optional<std::string> deploy_key = std::nullopt);

  // load resolves the effective key (resolve_effective_key) and returns its template.
  //
  // - Empty key: the built-in template.
  // - Cached key: the cached text, without re-validating or re-fetching.
  // - Otherwise the key is validated, fetched and cached.
  //
  // Throws:
  // - core::ValidationError if the key fails validate_prompt_override_key (nothing fetched)
  // - core::ConfigurationError if the key does not exist in the bucket
  // - core::TransportError (from the store) on backend failure
  [[nodiscard]] std::string load(const std::optional<std::string>& request_key);

  [[nodiscard]] const std::string& bucket() const noexcept { return bucket_; }
  [[nodiscard]] const std::optional<std::string>& deploy_key() const noexcept {
    return deploy_key_;
  }

 private:
  IPromptStore& store_;
  PromptCache& cache_;
  std::string bucket_;
  std::optional<std::string> deploy_key_;
};

}  // namespace injguard::prompt
