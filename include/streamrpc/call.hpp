#pragma once
#include "json_rpc.hpp"
#include "negotiator.hpp"
#include "session.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace streamrpc {

enum class CallState {
    Received,
    Negotiated,
    Executing,
    Completed,
    Failed
};

std::string_view to_string(CallState state);

enum class CancelReason {
    None,
    Requested,
    Timeout,
    Disconnected
};

/// Transport metadata travelling beside the envelope.
struct CallMetadata {
    std::optional<std::string> session_id;
    AcceptSet accept;
};

struct InboundCall {
    JsonRpcRequest request;
    CallMetadata meta;
};

/// Execution state of one call. Shared between the dispatching thread,
/// cancellation requests and the idle reaper.
class CallRecord {
public:
    CallRecord(std::string session_id, RequestId call_id, Clock::time_point now);

    const std::string& session_id() const { return session_id_; }
    const RequestId& call_id() const { return call_id_; }
    const std::string& key() const { return key_; }

    CallState state() const;
    void set_state(CallState s);

    /// Enter Completed or Failed. Returns false if already terminal.
    bool finish(CallState terminal);
    bool is_terminal() const;

    void touch(Clock::time_point now);
    Clock::time_point last_activity() const;

    /// Request cancellation. Returns false if the call is already terminal
    /// or already cancelled. Runs the cancel hook, if any.
    bool cancel(CancelReason reason, const std::string& message);
    bool cancelled() const;
    CancelReason cancel_reason() const;
    std::string cancel_message() const;

    /// Hook invoked on cancel(); clearing waits for a running hook.
    void set_cancel_hook(std::function<void()> hook);
    void clear_cancel_hook();

private:
    const std::string session_id_;
    const RequestId call_id_;
    const std::string key_;

    mutable std::mutex mutex_;
    CallState state_{CallState::Received};
    Clock::time_point last_activity_;
    CancelReason cancel_reason_{CancelReason::None};
    std::string cancel_message_;

    std::mutex hook_mutex_;
    std::function<void()> cancel_hook_;
};

/// What a handler sees of the call it is serving.
class CallContext {
public:
    explicit CallContext(std::shared_ptr<CallRecord> record)
        : record_(std::move(record)) {}

    const RequestId& call_id() const { return record_->call_id(); }
    const std::string& session_id() const { return record_->session_id(); }
    bool cancelled() const { return record_->cancelled(); }

    /// Run `hook` when the call is cancelled. One hook per call at a time;
    /// it must be cleared before whatever it captures goes away.
    void on_cancel(std::function<void()> hook) { record_->set_cancel_hook(std::move(hook)); }
    void clear_on_cancel() { record_->clear_cancel_hook(); }

private:
    std::shared_ptr<CallRecord> record_;
};

} // namespace streamrpc
