#pragma once

#include <chrono>

#include <nlohmann/json.hpp>

namespace mcptools {

using json = nlohmann::json;
using Clock = std::chrono::system_clock;
using Timestamp = std::chrono::time_point<Clock>;

} // namespace mcptools
