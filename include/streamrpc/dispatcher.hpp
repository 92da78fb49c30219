#pragma once
#include "call.hpp"
#include "event.hpp"
#include "negotiator.hpp"
#include "replay.hpp"
#include "router.hpp"
#include "session.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace streamrpc {

/// Destination of a streamed call's events, owned by the transport.
class EventSink {
public:
    virtual ~EventSink() = default;

    /// False once the consumer has gone away.
    virtual bool write(const StreamEvent& event) = 0;
};

/// Keeps events in memory; used for in-process consumers.
class MemorySink : public EventSink {
public:
    bool write(const StreamEvent& event) override;

    /// Simulate a consumer that disconnects after `n` events.
    void disconnect_after(size_t n);

    std::vector<StreamEvent> events() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::vector<StreamEvent> events_;
    std::optional<size_t> limit_;
};

/// A call that passed admission: session resolved, id reserved, mode chosen.
struct CallPlan {
    std::shared_ptr<Session> session;
    JsonRpcRequest request;
    ResponseMode mode = ResponseMode::Immediate;
    std::shared_ptr<CallRecord> record;
};

struct DispatchResult {
    std::string session_id;
    ResponseMode mode = ResponseMode::Immediate;
    std::optional<JsonRpcResponse> response;
};

struct SweepStats {
    size_t sessions_expired = 0;
    size_t calls_reaped = 0;
    size_t buffers_evicted = 0;
};

class CallDispatcher {
public:
    struct Options {
        NegotiationPolicy policy;
        std::chrono::milliseconds call_idle_timeout{std::chrono::minutes(5)};
    };

    CallDispatcher(Options opts, SessionStore& sessions, Router& router, ResumeRegistry& replay);

    CallDispatcher(const CallDispatcher&) = delete;
    CallDispatcher& operator=(const CallDispatcher&) = delete;

    /// Received -> Negotiated. Throws ProtocolViolation for bad params or a
    /// call id already used in the session.
    [[nodiscard]] CallPlan accept(const InboundCall& call);

    /// Execute a plan as a single response.
    [[nodiscard]] JsonRpcResponse run_immediate(const CallPlan& plan);

    /// Execute a plan as start, content..., then exactly one of end/error.
    void run_streamed(const CallPlan& plan, EventSink& sink);

    /// accept() followed by the run matching the negotiated mode.
    DispatchResult dispatch(const InboundCall& call, EventSink& sink);

    /// Stop forwarding a call's events and fail it. False if the call is
    /// not in flight.
    bool cancel(const std::string& session_id, const RequestId& call_id,
                const std::string& reason = "cancelled by caller");

    /// Continue a call's events after `last_seen`. Throws ResumeUnavailable.
    [[nodiscard]] ReplayCursor resume(const std::string& session_id,
                                      const std::string& call_key,
                                      int64_t last_seen);

    /// Delete a session, cancelling its calls and dropping its buffers.
    bool close_session(const std::string& session_id);

    /// Fail calls idle longer than the call timeout and release their
    /// replay buffers.
    size_t reap_idle_calls(Clock::time_point now = Clock::now());

    /// Session expiry, call reaping and replay eviction in one pass.
    SweepStats sweep(Clock::time_point now = Clock::now());

    /// Cancel everything and drop all sessions.
    void shutdown();

    void set_policy(NegotiationPolicy policy);
    NegotiationPolicy policy() const;

    size_t active_calls() const;

private:
    using CallKey = std::pair<std::string, std::string>;

    void complete(const CallPlan& plan);
    size_t cancel_session_calls(const std::string& session_id, CancelReason reason,
                                const std::string& message);
    static JsonRpcError cancellation_error(const CallRecord& record);

    Options opts_;
    SessionStore& sessions_;
    Router& router_;
    ResumeRegistry& replay_;

    mutable std::mutex policy_mutex_;

    mutable std::mutex calls_mutex_;
    std::map<CallKey, std::shared_ptr<CallRecord>> active_;
};

} // namespace streamrpc
