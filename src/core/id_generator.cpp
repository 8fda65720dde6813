#include "injguard/core/id_generator.h"

#include <chrono>

namespace injguard::core {

std::string SystemIdGenerator::next(std::string_view prefix) {
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          std::chrono::system_clock::now().time_since_epoch())
                          .count();
  const auto seq = sequence_.fetch_add(1, std::memory_order_relaxed);

  std::string id(prefix);
  id += '-';
  id += std::to_string(micros);
  id += '-';
  id += std::to_string(seq);
  return id;
}

std::string SequentialIdGenerator::next(std::string_view prefix) {
  const auto seq = sequence_.fetch_add(1, std::memory_order_relaxed);
  return std::string(prefix) + "-" + std::to_string(seq);
}

}  // namespace injguard::core
