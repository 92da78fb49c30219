#include "streamrpc/config.hpp"
#include "streamrpc/codec.hpp"
#include "streamrpc/error.hpp"
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace streamrpc {

namespace {

template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    if (!j.contains(key)) return;
    try {
        out = j.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

void read_ms(const nlohmann::json& j, const char* key, std::chrono::milliseconds& out) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_number_integer() || v.get<int64_t>() < 0) {
        throw ConfigError(std::string("'") + key + "' must be a non-negative integer");
    }
    out = std::chrono::milliseconds(v.get<int64_t>());
}

// Integers are range-checked before narrowing; nlohmann would wrap them.
template <typename T>
void read_int(const nlohmann::json& j, const char* key, T& out, int64_t min, int64_t max) {
    if (!j.contains(key)) return;
    const auto& v = j.at(key);
    if (!v.is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    if (v.is_number_unsigned() && v.get<uint64_t>() > static_cast<uint64_t>(max)) {
        throw ConfigError(std::string("'") + key + "' out of range");
    }
    int64_t n = v.get<int64_t>();
    if (n < min || n > max) {
        throw ConfigError(std::string("'") + key + "' must be in " + std::to_string(min) +
                          ".." + std::to_string(max) + ", got " + std::to_string(n));
    }
    out = static_cast<T>(n);
}

} // anonymous namespace

EngineConfig EngineConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("Config root must be a JSON object");
    }
    EngineConfig c;
    read_key(j, "host", c.host);
    read_int(j, "port", c.port, 1, 65535);
    read_key(j, "path", c.path);
    read_key(j, "allowed_origins", c.allowed_origins);
    read_key(j, "log_level", c.log_level);
    read_ms(j, "session_idle_timeout_ms", c.session_idle_timeout);
    read_ms(j, "call_idle_timeout_ms", c.call_idle_timeout);
    read_ms(j, "sweep_interval_ms", c.sweep_interval);
    read_int(j, "stream_threshold_bytes", c.stream_threshold_bytes, 0, INT64_MAX);
    read_key(j, "streamed_methods", c.streamed_methods);
    read_key(j, "immediate_methods", c.immediate_methods);
    read_int(j, "replay_capacity", c.replay_capacity, 1, INT64_MAX);
    read_ms(j, "replay_grace_ms", c.replay_grace);

    if (c.path.empty() || c.path.front() != '/') {
        throw ConfigError("'path' must start with '/'");
    }
    return c;
}

EngineConfig load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();
    try {
        return EngineConfig::from_json(Codec::parse_json(ss.str()));
    } catch (const ParseError& e) {
        throw ConfigError("Cannot parse config file " + path + ": " + e.what());
    }
}

void apply_env_overrides(EngineConfig& config) {
    if (const char* host = std::getenv("STREAMRPC_HOST")) {
        config.host = host;
    }
    if (const char* port = std::getenv("STREAMRPC_PORT")) {
        try {
            int p = std::stoi(port);
            if (p <= 0 || p > 65535) throw std::out_of_range("port");
            config.port = static_cast<uint16_t>(p);
        } catch (const std::exception&) {
            throw ConfigError(std::string("Invalid STREAMRPC_PORT: ") + port);
        }
    }
    if (const char* level = std::getenv("STREAMRPC_LOG_LEVEL")) {
        config.log_level = level;
    }
}

} // namespace streamrpc
