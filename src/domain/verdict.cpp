#include "injguard/domain/verdict.h"

namespace injguard::domain {

nlohmann::json to_json(const Verdict& verdict) {
  return nlohmann::json{
      {"safe", verdict.safe},
      {"reasoning", verdict.reasoning},
  };
}

}  // namespace injguard::domain
