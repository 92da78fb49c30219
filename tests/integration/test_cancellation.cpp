#include <gtest/gtest.h>
#include "streamrpc/server.hpp"
#include "streamrpc/client.hpp"
#include "streamrpc/error.hpp"
#include <atomic>
#include <thread>
#include <chrono>

using namespace streamrpc;

namespace {

/// A streaming method that sends one fragment and then waits for its
/// caller to go away.
std::unique_ptr<FragmentSource> stalled(const nlohmann::json&, CallContext&) {
    auto channel = std::make_shared<FragmentChannel>();
    channel->push("thinking...");
    return std::make_unique<ChannelSource>(channel);
}

void start(StreamServer& server, std::thread& thread) {
    thread = std::thread([&server]() { server.serve_http(); });
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
}

} // namespace

TEST(CancellationTest, CancelNotificationStopsStream) {
    EngineConfig config;
    config.port = 18925;
    StreamServer server{config};
    server.add_streaming_method("stalled", stalled);
    server.add_method("ping", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        return nlohmann::json::object();
    });
    std::thread server_thread;
    start(server, server_thread);

    HttpClient client{"http://127.0.0.1:18925/mcp"};
    // Establish the session first so cancel() can name it.
    client.call("ping");

    std::atomic<bool> got_content{false};
    JsonRpcRequest req;
    req.id = client.next_id();
    req.method = "stalled";

    CallOutcome outcome;
    std::thread caller([&] {
        outcome = client.call(req, [&](const StreamEvent& ev) {
            if (ev.kind == EventKind::Content) got_content = true;
            return true;
        });
    });
    while (!got_content) std::this_thread::sleep_for(std::chrono::milliseconds(5));

    EXPECT_NO_THROW(client.cancel(req.id, "user pressed stop"));
    caller.join();

    ASSERT_TRUE(outcome.complete());
    auto err = outcome.error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error::CallCancelled);
    EXPECT_NE(err->message.find("user pressed stop"), std::string::npos);

    server.shutdown();
    if (server_thread.joinable()) server_thread.join();
}

TEST(CancellationTest, CancelUnknownCallIsHarmless) {
    EngineConfig config;
    config.port = 18926;
    StreamServer server{config};
    std::thread server_thread;
    start(server, server_thread);

    HttpClient client{"http://127.0.0.1:18926/mcp"};
    EXPECT_NO_THROW(client.cancel(RequestId{int64_t{999}}, "test cancel"));

    server.shutdown();
    if (server_thread.joinable()) server_thread.join();
}

TEST(CancellationTest, IdleCallTimesOut) {
    EngineConfig config;
    config.port = 18927;
    config.call_idle_timeout = std::chrono::milliseconds(200);
    config.sweep_interval = std::chrono::milliseconds(50);
    StreamServer server{config};
    server.add_streaming_method("stalled", stalled);
    std::thread server_thread;
    start(server, server_thread);

    HttpClient client{"http://127.0.0.1:18927/mcp"};
    auto started = std::chrono::steady_clock::now();
    auto outcome = client.call("stalled");
    auto elapsed = std::chrono::steady_clock::now() - started;

    ASSERT_TRUE(outcome.complete());
    ASSERT_EQ(outcome.events.size(), 3u);
    auto err = outcome.error();
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(err->code, error::CallTimeout);
    EXPECT_GE(elapsed, std::chrono::milliseconds(200));
    EXPECT_LT(elapsed, std::chrono::seconds(5));

    server.shutdown();
    if (server_thread.joinable()) server_thread.join();
}

TEST(CancellationTest, SlowImmediateCallHitsClientReadTimeout) {
    EngineConfig config;
    config.port = 18928;
    StreamServer server{config};
    server.add_method("slow", [](const nlohmann::json&, CallContext&) -> HandlerResult {
        std::this_thread::sleep_for(std::chrono::milliseconds(2500));
        return "late";
    });
    std::thread server_thread;
    start(server, server_thread);

    HttpClient::Options opts;
    opts.streaming = false;
    opts.read_timeout = std::chrono::seconds(1);
    HttpClient client{"http://127.0.0.1:18928/mcp", opts};

    auto started = std::chrono::steady_clock::now();
    EXPECT_THROW(client.call("slow"), Error);
    EXPECT_GE(std::chrono::steady_clock::now() - started, std::chrono::milliseconds(900));

    server.shutdown();
    if (server_thread.joinable()) server_thread.join();
}
