#include <benchmark/benchmark.h>
#include "streamrpc/codec.hpp"
#include "streamrpc/event_framer.hpp"
#include <string>
#include <vector>

using namespace streamrpc;

static const std::string kSmallRequest =
    R"({"jsonrpc":"2.0","id":1,"method":"greeting","params":{"name":"Ada"}})";

static const std::string kChatRequest =
    R"({"jsonrpc":"2.0","id":"c-42","method":"chat","params":{"message":"Summarise the incident report","history":[{"role":"user","text":"hi"},{"role":"assistant","text":"Hello!"}]}})";

static StreamEvent make_content(int64_t seq, size_t payload_size) {
    StreamEvent ev;
    ev.call_id = RequestId{std::string{"c-42"}};
    ev.sequence = seq;
    ev.kind = EventKind::Content;
    ev.payload = std::string(payload_size, 'w');
    return ev;
}

// One streamed call: start, n content events, end.
static std::string make_stream(int n) {
    StreamEvent start;
    start.call_id = RequestId{std::string{"c-42"}};
    start.kind = EventKind::Start;
    start.payload = nlohmann::json{{"session", "s-1"}};

    std::string out = EventEncoder::encode(start);
    for (int i = 1; i <= n; ++i) out += EventEncoder::encode(make_content(i, 24));

    StreamEvent end;
    end.call_id = start.call_id;
    end.sequence = n + 1;
    end.kind = EventKind::End;
    out += EventEncoder::encode(end);
    return out;
}

// ---- Inbound parse ----

static void BM_ParseSmallRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kSmallRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kSmallRequest.size());
}
BENCHMARK(BM_ParseSmallRequest)->MinTime(1.0);

static void BM_ParseChatRequest(benchmark::State& state) {
    for (auto _ : state) {
        auto msg = Codec::parse(kChatRequest);
        benchmark::DoNotOptimize(msg);
    }
    state.SetBytesProcessed(state.iterations() * kChatRequest.size());
}
BENCHMARK(BM_ParseChatRequest)->MinTime(1.0);

// ---- Encode ----

static void BM_EncodeContentEvent(benchmark::State& state) {
    auto ev = make_content(7, static_cast<size_t>(state.range(0)));
    size_t bytes = 0;
    for (auto _ : state) {
        auto unit = EventEncoder::encode(ev);
        bytes += unit.size();
        benchmark::DoNotOptimize(unit);
    }
    state.SetBytesProcessed(static_cast<int64_t>(bytes));
}
BENCHMARK(BM_EncodeContentEvent)->Arg(16)->Arg(256)->Arg(4096)->MinTime(1.0);

// ---- Decode ----

static void BM_DecodeStream(benchmark::State& state) {
    const std::string raw = make_stream(static_cast<int>(state.range(0)));
    for (auto _ : state) {
        EventDecoder decoder;
        decoder.feed(raw);
        size_t count = 0;
        while (std::holds_alternative<StreamEvent>(decoder.decode())) ++count;
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeStream)->Arg(16)->Arg(256)->MinTime(1.0);

static void BM_DecodeFragmentedStream(benchmark::State& state) {
    const std::string raw = make_stream(64);
    const size_t piece = static_cast<size_t>(state.range(0));
    for (auto _ : state) {
        EventDecoder decoder;
        size_t count = 0;
        for (size_t off = 0; off < raw.size(); off += piece) {
            decoder.feed(std::string_view(raw).substr(off, piece));
            while (std::holds_alternative<StreamEvent>(decoder.decode())) ++count;
        }
        benchmark::DoNotOptimize(count);
    }
    state.SetBytesProcessed(state.iterations() * raw.size());
}
BENCHMARK(BM_DecodeFragmentedStream)->Arg(7)->Arg(512)->MinTime(1.0);

static void BM_ParseLastEventId(benchmark::State& state) {
    const std::string value = EventEncoder::event_id(RequestId{std::string{"c-42"}}, 1234);
    for (auto _ : state) {
        auto parsed = parse_last_event_id(value);
        benchmark::DoNotOptimize(parsed);
    }
}
BENCHMARK(BM_ParseLastEventId)->MinTime(1.0);
