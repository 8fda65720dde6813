#pragma once

#include <nlohmann/json.hpp>

#include "../server_context.h"

namespace injguard::server::handlers {

nlohmann::json handle_classify_input(const nlohmann::json& params, ServerContext& ctx);

}  // namespace injguard::server::handlers
