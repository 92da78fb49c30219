#pragma once
#include <spdlog/spdlog.h>
#include <memory>
#include <string>

namespace streamrpc {
namespace logging {

using Level = spdlog::level::level_enum;

/// Library-wide logger ("streamrpc", stderr). Created on first use.
std::shared_ptr<spdlog::logger> logger();

void set_level(Level level);
Level level();

/// Accepts trace, debug, info, warn/warning, error, critical, off
/// (case-insensitive). Throws std::invalid_argument otherwise.
Level level_from_string(const std::string& name);

} // namespace logging
} // namespace streamrpc
