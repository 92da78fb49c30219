#pragma once
#include <nlohmann/json.hpp>
#include <chrono>
#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace streamrpc {

struct EngineConfig {
    // HTTP surface
    std::string host = "127.0.0.1";
    uint16_t port = 8080;
    std::string path = "/mcp";
    std::vector<std::string> allowed_origins;
    std::string log_level = "info";

    // Lifetimes
    std::chrono::milliseconds session_idle_timeout{std::chrono::minutes(30)};
    std::chrono::milliseconds call_idle_timeout{std::chrono::minutes(5)};
    std::chrono::milliseconds sweep_interval{std::chrono::seconds(1)};

    // Negotiation policy
    size_t stream_threshold_bytes = 256;
    std::set<std::string> streamed_methods;
    std::set<std::string> immediate_methods;

    // Replay
    size_t replay_capacity = 1024;
    std::chrono::milliseconds replay_grace{std::chrono::seconds(30)};

    /// Overlay the keys present in `j` on the defaults. Throws ConfigError
    /// on a value of the wrong type.
    static EngineConfig from_json(const nlohmann::json& j);
};

/// Read a JSON config file. Throws ConfigError if it cannot be read or parsed.
EngineConfig load_config(const std::string& path);

/// STREAMRPC_HOST, STREAMRPC_PORT, STREAMRPC_LOG_LEVEL.
void apply_env_overrides(EngineConfig& config);

} // namespace streamrpc
