#include "streamrpc/logging.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <algorithm>
#include <cctype>
#include <mutex>
#include <stdexcept>

namespace streamrpc {
namespace logging {

namespace {
std::once_flag g_init;
std::shared_ptr<spdlog::logger> g_logger;
} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::call_once(g_init, [] {
        g_logger = spdlog::get("streamrpc");
        if (!g_logger) {
            g_logger = spdlog::stderr_color_mt("streamrpc");
            g_logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v");
            g_logger->set_level(spdlog::level::info);
        }
    });
    return g_logger;
}

void set_level(Level level) {
    logger()->set_level(level);
}

Level level() {
    return logger()->level();
}

Level level_from_string(const std::string& name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    throw std::invalid_argument("Invalid log level: " + name);
}

} // namespace logging
} // namespace streamrpc
