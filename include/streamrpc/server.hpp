#pragma once
#include "config.hpp"
#include "dispatcher.hpp"
#include "router.hpp"
#include "session.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <string>

namespace streamrpc {

/// Owns the engine (sessions, handlers, replay state, dispatcher) and runs
/// it behind a transport.
class StreamServer {
public:
    explicit StreamServer(EngineConfig config = {});
    ~StreamServer();

    // Non-copyable, non-movable
    StreamServer(const StreamServer&) = delete;
    StreamServer& operator=(const StreamServer&) = delete;

    // ---- Method registration ----
    void add_method(const std::string& name, CallHandler handler);
    /// `always_stream` puts the method on the streamed list, so callers that
    /// accept events get them regardless of the size threshold.
    void add_streaming_method(const std::string& name, StreamHandler handler,
                              bool always_stream = true);
    void remove_method(const std::string& name);

    // ---- Transport ----
    void serve(std::unique_ptr<ITransport> transport);
    /// HTTP on the configured host, port and path.
    void serve_http();
    void serve_http(const std::string& host, uint16_t port);
    void shutdown();

    bool is_running() const;

    /// One maintenance pass. The sweeper thread calls this while serving.
    SweepStats sweep();

    const EngineConfig& config() const;
    CallDispatcher& dispatcher();
    Router& router();
    SessionStore& sessions();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamrpc
