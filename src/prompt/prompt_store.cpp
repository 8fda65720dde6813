#include "injguard/prompt/prompt_store.h"

#include "injguard/core/errors.h"

#include <fstream>
#include <sstream>
#include <system_error>

namespace injguard::prompt {

void InMemoryPromptStore::put_object(const std::string& bucket, const std::string& key,
                                     std::string body) {
  objects_[{bucket, key}] = std::move(body);
}

std::optional<std::string> InMemoryPromptStore::get_object(const std::string& bucket,
                                                           const std::string& key) {
  ++fetch_count_;
  const auto it = objects_.find({bucket, key});
  if (it == objects_.end()) {
    return std::nullopt;
  }
  return it->second;
}

FilesystemPromptStore::FilesystemPromptStore(std::filesystem::path root)
    : root_(std::move(root)) {}

std::optional<std::string> FilesystemPromptStore::get_object(const std::string& bucket,
                                                             const std::string& key) {
  const std::filesystem::path path = root_ / bucket / key;

  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return std::nullopt;
  }
  if (!std::filesystem::is_regular_file(status)) {
    throw core::TransportError("Prompt object is not a regular file: " + path.string());
  }

  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw core::TransportError("Failed to open prompt object: " + path.string());
  }
  std::ostringstream body;
  body << in.rdbuf();
  if (in.bad()) {
    throw core::TransportError("Failed to read prompt object: " + path.string());
  }
  return body.str();
}

std::string FilesystemPromptStore::describe() const {
  return "filesystem -- " + root_.string();
}

}  // namespace injguard::prompt
