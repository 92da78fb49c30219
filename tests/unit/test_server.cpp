#include <gtest/gtest.h>
#include "streamrpc/server.hpp"
#include "streamrpc/error.hpp"
#include <thread>
#include <chrono>

using namespace streamrpc;

namespace {

/// Runs a fixed script of calls against the dispatcher, then returns.
/// Results land in caller-owned storage since serve() destroys the transport.
class ScriptedTransport : public ITransport {
public:
    struct Log {
        std::vector<DispatchResult> results;
        std::vector<std::vector<StreamEvent>> streams;
    };

    ScriptedTransport(std::vector<InboundCall> calls, Log& log)
        : calls_(std::move(calls)), log_(log) {}

    void start(CallDispatcher& dispatcher) override {
        connected_ = true;
        for (const auto& call : calls_) {
            MemorySink sink;
            log_.results.push_back(dispatcher.dispatch(call, sink));
            log_.streams.push_back(sink.events());
        }
        connected_ = false;
    }
    void shutdown() override { connected_ = false; }
    bool is_connected() const override { return connected_; }

private:
    std::vector<InboundCall> calls_;
    Log& log_;
    bool connected_ = false;
};

InboundCall make_call(int64_t id, const std::string& method, nlohmann::json params) {
    InboundCall call;
    call.request.id = RequestId{id};
    call.request.method = method;
    call.request.params = std::move(params);
    call.meta.accept = AcceptSet{true, true};
    return call;
}

} // namespace

TEST(StreamServer, Construction) {
    StreamServer server;
    EXPECT_FALSE(server.is_running());
    EXPECT_EQ(server.config().path, "/mcp");
    EXPECT_EQ(server.sessions().size(), 0u);
}

TEST(StreamServer, StreamingMethodJoinsStreamedList) {
    StreamServer server;
    server.add_streaming_method("chat", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{"a"});
    });
    server.add_streaming_method("maybe", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{});
    }, false);

    auto policy = server.dispatcher().policy();
    EXPECT_EQ(policy.streamed_methods.count("chat"), 1u);
    EXPECT_EQ(policy.streamed_methods.count("maybe"), 0u);

    server.remove_method("chat");
    EXPECT_EQ(server.dispatcher().policy().streamed_methods.count("chat"), 0u);
    EXPECT_FALSE(server.router().has_handler("chat"));
}

TEST(StreamServer, ConfiguredListsReachPolicy) {
    EngineConfig config;
    config.stream_threshold_bytes = 0;
    config.immediate_methods = {"greeting"};
    StreamServer server{config};
    auto policy = server.dispatcher().policy();
    EXPECT_EQ(policy.stream_threshold_bytes, 0u);
    EXPECT_EQ(policy.immediate_methods.count("greeting"), 1u);
}

TEST(StreamServer, ServeRunsCallsThroughTransport) {
    StreamServer server;
    server.add_method("greeting", [](const nlohmann::json& params, CallContext&) -> HandlerResult {
        return "Hello, " + params.value("name", std::string("Friend")) + "!";
    });
    server.add_streaming_method("chat", [](const nlohmann::json&, CallContext&) {
        return std::make_unique<VectorSource>(std::vector<nlohmann::json>{"Hi", " there"});
    });

    ScriptedTransport::Log log;
    std::vector<InboundCall> calls;
    calls.push_back(make_call(1, "greeting", {{"name", "Ada"}}));
    calls.push_back(make_call(2, "chat", {{"message", "hi"}}));

    server.serve(std::make_unique<ScriptedTransport>(std::move(calls), log));
    EXPECT_FALSE(server.is_running());

    ASSERT_EQ(log.results.size(), 2u);
    EXPECT_EQ(log.results[0].response->result, nlohmann::json("Hello, Ada!"));
    EXPECT_EQ(log.results[1].mode, ResponseMode::Streamed);
    ASSERT_EQ(log.streams[1].size(), 4u);
    EXPECT_EQ(log.streams[1][1].payload, "Hi");
}

TEST(StreamServer, ShutdownBeforeServeReturnsImmediately) {
    StreamServer server;
    server.shutdown();
    ScriptedTransport::Log log;
    std::vector<InboundCall> calls;
    calls.push_back(make_call(1, "anything", nlohmann::json::object()));
    server.serve(std::make_unique<ScriptedTransport>(std::move(calls), log));
    EXPECT_TRUE(log.results.empty());
    EXPECT_FALSE(server.is_running());
}

TEST(StreamServer, SweepWithNothingToDo) {
    StreamServer server;
    auto stats = server.sweep();
    EXPECT_EQ(stats.sessions_expired, 0u);
    EXPECT_EQ(stats.calls_reaped, 0u);
    EXPECT_EQ(stats.buffers_evicted, 0u);
}
