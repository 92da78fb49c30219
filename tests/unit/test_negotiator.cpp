#include <gtest/gtest.h>
#include "streamrpc/negotiator.hpp"

using namespace streamrpc;

namespace {

JsonRpcRequest make_call(const std::string& method, nlohmann::json params) {
    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = method;
    req.params = std::move(params);
    return req;
}

const Capabilities kStreaming{true, true};
const AcceptSet kAcceptsEvents{true, true};

} // namespace

TEST(AcceptSet, FromHeaders) {
    auto sse = AcceptSet::from_headers("application/json, text/event-stream");
    EXPECT_TRUE(sse.streaming);
    EXPECT_TRUE(sse.resume);

    auto json_only = AcceptSet::from_headers("application/json");
    EXPECT_FALSE(json_only.streaming);
    EXPECT_FALSE(json_only.resume);

    auto wildcard = AcceptSet::from_headers("*/*");
    EXPECT_TRUE(wildcard.streaming);

    auto upper = AcceptSet::from_headers("Text/Event-Stream");
    EXPECT_TRUE(upper.streaming);
}

TEST(AcceptSet, ResumeOptOut) {
    auto set = AcceptSet::from_headers("text/event-stream", "off");
    EXPECT_TRUE(set.streaming);
    EXPECT_FALSE(set.resume);
    EXPECT_EQ(set.to_capabilities(), (Capabilities{true, false}));
}

TEST(AcceptSet, ResumeRequiresStreaming) {
    AcceptSet set{false, true};
    EXPECT_EQ(set.to_capabilities(), (Capabilities{false, false}));
}

TEST(Negotiator, NoNegotiatedStreamingIsImmediate) {
    NegotiationPolicy policy;
    policy.stream_threshold_bytes = 0;
    auto call = make_call("echo", nlohmann::json{{"text", std::string(1000, 'x')}});
    EXPECT_EQ(decide(policy, Capabilities{false, false}, call, kAcceptsEvents),
              ResponseMode::Immediate);
}

TEST(Negotiator, CallThatDeclinesEventsIsImmediate) {
    NegotiationPolicy policy;
    policy.streamed_methods.insert("chat");
    auto call = make_call("chat", nlohmann::json::object());
    EXPECT_EQ(decide(policy, kStreaming, call, AcceptSet{false, false}), ResponseMode::Immediate);
}

TEST(Negotiator, ThresholdOnParamsSize) {
    NegotiationPolicy policy;
    policy.stream_threshold_bytes = 32;
    EXPECT_EQ(decide(policy, kStreaming, make_call("echo", {{"text", "hi"}}), kAcceptsEvents),
              ResponseMode::Immediate);
    EXPECT_EQ(decide(policy, kStreaming,
                     make_call("echo", {{"text", std::string(64, 'x')}}), kAcceptsEvents),
              ResponseMode::Streamed);
}

TEST(Negotiator, ZeroThresholdStreamsEverything) {
    NegotiationPolicy policy;
    policy.stream_threshold_bytes = 0;
    JsonRpcRequest bare;
    bare.id = RequestId{int64_t{1}};
    bare.method = "get_capabilities";
    EXPECT_EQ(decide(policy, kStreaming, bare, kAcceptsEvents), ResponseMode::Streamed);
}

TEST(Negotiator, MethodListsOverrideThreshold) {
    NegotiationPolicy policy;
    policy.stream_threshold_bytes = 0;
    policy.immediate_methods.insert("greeting");
    policy.streamed_methods.insert("chat");
    auto small = nlohmann::json::object();
    EXPECT_EQ(decide(policy, kStreaming, make_call("greeting", small), kAcceptsEvents),
              ResponseMode::Immediate);

    policy.stream_threshold_bytes = 1 << 20;
    EXPECT_EQ(decide(policy, kStreaming, make_call("chat", small), kAcceptsEvents),
              ResponseMode::Streamed);
}

TEST(Negotiator, DecisionIsDeterministic) {
    NegotiationPolicy policy;
    auto call = make_call("echo", {{"text", std::string(300, 'y')}});
    auto first = decide(policy, kStreaming, call, kAcceptsEvents);
    for (int i = 0; i < 10; ++i) {
        EXPECT_EQ(decide(policy, kStreaming, call, kAcceptsEvents), first);
    }
}
