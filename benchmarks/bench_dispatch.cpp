#include <benchmark/benchmark.h>
#include "streamrpc/dispatcher.hpp"
#include "streamrpc/logging.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

using namespace streamrpc;

namespace {

// Owns everything a dispatcher borrows.
struct Engine {
    SessionStore sessions;
    Router router;
    ResumeRegistry replay;
    std::unique_ptr<CallDispatcher> dispatcher;

    explicit Engine(size_t threshold) {
        CallDispatcher::Options opts;
        opts.policy.stream_threshold_bytes = threshold;
        dispatcher = std::make_unique<CallDispatcher>(opts, sessions, router, replay);
    }
};

std::unique_ptr<Engine> make_engine(int n_methods, size_t threshold = 256) {
    auto engine = std::make_unique<Engine>(threshold);
    for (int i = 0; i < n_methods; ++i) {
        engine->router.on_call("method_" + std::to_string(i),
            [](const nlohmann::json&, CallContext&) -> HandlerResult {
                return nlohmann::json{{"result", "ok"}};
            });
    }
    engine->router.on_call("greeting", [](const nlohmann::json& params, CallContext&) -> HandlerResult {
        return "Hello, " + params.value("name", std::string("Friend")) + "!";
    });
    engine->router.on_stream("chat", [](const nlohmann::json&, CallContext&) {
        std::vector<nlohmann::json> words;
        for (int i = 0; i < 16; ++i) words.push_back("word" + std::to_string(i) + " ");
        return std::make_unique<VectorSource>(std::move(words));
    });
    return engine;
}

// Every call after the first reuses the session the first one created.
InboundCall make_call(const std::string& method, nlohmann::json params, bool streaming) {
    InboundCall call;
    call.request.method = method;
    call.request.params = std::move(params);
    call.meta.accept = AcceptSet{streaming, false};
    return call;
}

// Keeps nothing, so only dispatch cost is measured.
class NullSink : public EventSink {
public:
    bool write(const StreamEvent& event) override {
        benchmark::DoNotOptimize(event);
        return true;
    }
};

} // namespace

static void BM_DispatchImmediate(benchmark::State& state) {
    logging::set_level(spdlog::level::err);
    auto engine = make_engine(1);
    NullSink sink;
    auto call = make_call("greeting", {{"name", "Ada"}}, false);

    int64_t id = 0;
    for (auto _ : state) {
        call.request.id = RequestId{++id};
        auto result = engine->dispatcher->dispatch(call, sink);
        call.meta.session_id = result.session_id;
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchImmediate)->MinTime(1.0);

static void BM_DispatchUnknownMethod(benchmark::State& state) {
    logging::set_level(spdlog::level::err);
    auto engine = make_engine(1);
    NullSink sink;
    auto call = make_call("not_registered_method", nlohmann::json::object(), false);

    int64_t id = 0;
    for (auto _ : state) {
        call.request.id = RequestId{++id};
        auto result = engine->dispatcher->dispatch(call, sink);
        call.meta.session_id = result.session_id;
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_DispatchUnknownMethod)->MinTime(1.0);

static void BM_DispatchStreamed(benchmark::State& state) {
    logging::set_level(spdlog::level::err);
    auto engine = make_engine(1, 0);
    NullSink sink;
    auto call = make_call("chat", {{"message", "hi"}}, true);

    int64_t id = 0;
    for (auto _ : state) {
        call.request.id = RequestId{++id};
        auto result = engine->dispatcher->dispatch(call, sink);
        call.meta.session_id = result.session_id;
        benchmark::DoNotOptimize(result);
    }
    // start + 16 content + end
    state.SetItemsProcessed(state.iterations() * 18);
}
BENCHMARK(BM_DispatchStreamed)->MinTime(1.0);

static void BM_Dispatch100Methods(benchmark::State& state) {
    logging::set_level(spdlog::level::err);
    auto engine = make_engine(100);
    NullSink sink;

    std::vector<InboundCall> calls;
    for (int i = 0; i < 100; ++i) {
        calls.push_back(make_call("method_" + std::to_string(i), nlohmann::json::object(), false));
    }

    std::optional<std::string> session;
    int64_t id = 0;
    for (auto _ : state) {
        auto& call = calls[id % 100];
        call.request.id = RequestId{++id};
        call.meta.session_id = session;
        auto result = engine->dispatcher->dispatch(call, sink);
        session = result.session_id;
        benchmark::DoNotOptimize(result);
    }
}
BENCHMARK(BM_Dispatch100Methods)->MinTime(1.0);

static void BM_NegotiateDecision(benchmark::State& state) {
    NegotiationPolicy policy;
    policy.immediate_methods = {"greeting"};
    Capabilities negotiated{true, true};
    AcceptSet declared{true, true};

    JsonRpcRequest req;
    req.id = RequestId{int64_t{1}};
    req.method = "chat";
    req.params = nlohmann::json{{"message", std::string(512, 'x')}};

    for (auto _ : state) {
        auto mode = decide(policy, negotiated, req, declared);
        benchmark::DoNotOptimize(mode);
    }
}
BENCHMARK(BM_NegotiateDecision)->MinTime(1.0);
