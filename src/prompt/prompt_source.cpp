#include "injguard/prompt/prompt_source.h"

#include "injguard/core/errors.h"
#include "injguard/prompt/default_prompt.h"
#include "injguard/prompt/prompt_override_key.h"

#include <iostream>

namespace injguard::prompt {

PromptSource::PromptSource(IPromptStore& store, PromptCache& cache, std::string bucket,
                           std::optional<std::string> deploy_key)
    : store_(store), cache_(cache), bucket_(std::move(bucket)), deploy_key_(std::move(deploy_key)) {}

std::string PromptSource::load(const std::optional<std::string>& request_key) {
  const std::string key = resolve_effective_key(request_key, deploy_key_);

  if (key.empty()) {
    if (auto cached = cache_.find(kDefaultTemplateCacheKey)) {
      return *cached;
    }
    std::cerr << "Using default built-in prompt (" << kDefaultPromptTemplate.size()
              << " characters)\n";
    return cache_.insert(kDefaultTemplateCacheKey, std::string(kDefaultPromptTemplate));
  }

  // The sentinel is not a key; a caller spelling it out must go through validation.
  if (key != kDefaultTemplateCacheKey) {
    if (auto cached = cache_.find(key)) {
      return *cached;
    }
  }

  const std::string key_error = validate_prompt_override_key(key);
  if (!key_error.empty()) {
    throw core::ValidationError(key_error);
  }

  std::cerr << "Loading custom prompt: " << bucket_ << "/" << key << " from "
            << store_.describe() << "\n";

  auto body = store_.get_object(bucket_, key);
  if (!body.has_value()) {
    const std::string message =
        "Prompt override key '" + key + "' does not exist in bucket '" + bucket_ + "'";
    std::cerr << "ERROR: " << message << "\n";
    throw core::ConfigurationError(message);
  }

  std::cerr << "Loaded custom prompt (" << body->size() << " characters)\n";
  return cache_.insert(key, std::move(*body));
}

}  // namespace injguard::prompt
