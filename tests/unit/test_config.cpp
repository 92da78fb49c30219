#include <gtest/gtest.h>
#include "streamrpc/config.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/logging.hpp"
#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <fstream>

using namespace streamrpc;
using namespace std::chrono_literals;

TEST(EngineConfig, Defaults) {
    EngineConfig c;
    EXPECT_EQ(c.path, "/mcp");
    EXPECT_EQ(c.stream_threshold_bytes, 256u);
    EXPECT_EQ(c.replay_capacity, 1024u);
    EXPECT_EQ(c.session_idle_timeout, 30min);
}

TEST(EngineConfig, FromJsonOverlaysKeys) {
    auto c = EngineConfig::from_json({
        {"port", 9001},
        {"path", "/rpc"},
        {"call_idle_timeout_ms", 2500},
        {"stream_threshold_bytes", 0},
        {"streamed_methods", {"chat"}},
        {"allowed_origins", {"http://localhost"}}
    });
    EXPECT_EQ(c.port, 9001);
    EXPECT_EQ(c.path, "/rpc");
    EXPECT_EQ(c.call_idle_timeout, 2500ms);
    EXPECT_EQ(c.stream_threshold_bytes, 0u);
    EXPECT_EQ(c.streamed_methods.count("chat"), 1u);
    ASSERT_EQ(c.allowed_origins.size(), 1u);
    // untouched keys keep defaults
    EXPECT_EQ(c.host, "127.0.0.1");
}

TEST(EngineConfig, RejectsBadValues) {
    EXPECT_THROW(EngineConfig::from_json(nlohmann::json::array()), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"port", "eighty"}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"path", "mcp"}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"replay_capacity", 0}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"sweep_interval_ms", -1}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"replay_grace_ms", 1.5}}), ConfigError);
}

TEST(EngineConfig, IntegersOutOfRangeAreRejectedNotWrapped) {
    EXPECT_THROW(EngineConfig::from_json({{"port", 70000}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"port", 0}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"port", -1}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"port", 80.5}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"stream_threshold_bytes", -1}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"replay_capacity", -5}}), ConfigError);
    EXPECT_THROW(EngineConfig::from_json({{"replay_capacity", UINT64_MAX}}), ConfigError);

    EXPECT_EQ(EngineConfig::from_json({{"port", 65535}}).port, 65535);
    EXPECT_EQ(EngineConfig::from_json({{"port", 1}}).port, 1);
}

TEST(EngineConfig, LoadFromFile) {
    std::string path = ::testing::TempDir() + "streamrpc_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"host":"0.0.0.0","replay_grace_ms":500,"log_level":"debug"})";
    }
    auto c = load_config(path);
    EXPECT_EQ(c.host, "0.0.0.0");
    EXPECT_EQ(c.replay_grace, 500ms);
    EXPECT_EQ(c.log_level, "debug");
    std::remove(path.c_str());
}

TEST(EngineConfig, LoadFailures) {
    EXPECT_THROW(load_config("/nonexistent/streamrpc.json"), ConfigError);

    std::string path = ::testing::TempDir() + "streamrpc_bad_config.json";
    {
        std::ofstream out(path);
        out << "{ not json";
    }
    EXPECT_THROW(load_config(path), ConfigError);
    std::remove(path.c_str());
}

TEST(EngineConfig, EnvironmentOverrides) {
    setenv("STREAMRPC_HOST", "10.0.0.1", 1);
    setenv("STREAMRPC_PORT", "18080", 1);
    setenv("STREAMRPC_LOG_LEVEL", "warn", 1);
    EngineConfig c;
    apply_env_overrides(c);
    EXPECT_EQ(c.host, "10.0.0.1");
    EXPECT_EQ(c.port, 18080);
    EXPECT_EQ(c.log_level, "warn");

    setenv("STREAMRPC_PORT", "99999", 1);
    EXPECT_THROW(apply_env_overrides(c), ConfigError);

    unsetenv("STREAMRPC_HOST");
    unsetenv("STREAMRPC_PORT");
    unsetenv("STREAMRPC_LOG_LEVEL");
}

TEST(Logging, LevelNames) {
    EXPECT_EQ(logging::level_from_string("DEBUG"), spdlog::level::debug);
    EXPECT_EQ(logging::level_from_string("warning"), spdlog::level::warn);
    EXPECT_EQ(logging::level_from_string("off"), spdlog::level::off);
    EXPECT_THROW(logging::level_from_string("loud"), std::invalid_argument);
}

TEST(Logging, SetLevelAppliesToLogger) {
    auto before = logging::level();
    logging::set_level(spdlog::level::err);
    EXPECT_EQ(logging::logger()->level(), spdlog::level::err);
    logging::set_level(before);
}
