#pragma once

#include <cstddef>
#include <string>
#include <string_view>

#include "mcptools/core/types.hpp"

namespace mcptools::utils {

auto generate_uuid() -> std::string;
auto timestamp_iso(Timestamp tp) -> std::string;
auto trim(std::string_view s) -> std::string;
auto url_encode(std::string_view s) -> std::string;

/// Keeps at most the last `max_bytes` bytes of `s`, prefixed with "..."
/// when something was cut.
auto tail(std::string_view s, std::size_t max_bytes) -> std::string;

} // namespace mcptools::utils
