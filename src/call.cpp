#include "streamrpc/call.hpp"

namespace streamrpc {

std::string_view to_string(CallState state) {
    switch (state) {
        case CallState::Received:   return "received";
        case CallState::Negotiated: return "negotiated";
        case CallState::Executing:  return "executing";
        case CallState::Completed:  return "completed";
        case CallState::Failed:     return "failed";
    }
    return "received";
}

CallRecord::CallRecord(std::string session_id, RequestId call_id, Clock::time_point now)
    : session_id_(std::move(session_id))
    , call_id_(std::move(call_id))
    , key_(to_key(call_id_))
    , last_activity_(now) {
}

CallState CallRecord::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

void CallRecord::set_state(CallState s) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CallState::Completed || state_ == CallState::Failed) return;
    state_ = s;
}

bool CallRecord::finish(CallState terminal) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (state_ == CallState::Completed || state_ == CallState::Failed) return false;
    state_ = terminal;
    return true;
}

bool CallRecord::is_terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_ == CallState::Completed || state_ == CallState::Failed;
}

void CallRecord::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now > last_activity_) last_activity_ = now;
}

Clock::time_point CallRecord::last_activity() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_activity_;
}

bool CallRecord::cancel(CancelReason reason, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (state_ == CallState::Completed || state_ == CallState::Failed) return false;
        if (cancel_reason_ != CancelReason::None) return false;
        cancel_reason_ = reason;
        cancel_message_ = message;
    }
    std::lock_guard<std::mutex> lock(hook_mutex_);
    if (cancel_hook_) cancel_hook_();
    return true;
}

bool CallRecord::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_reason_ != CancelReason::None;
}

CancelReason CallRecord::cancel_reason() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_reason_;
}

std::string CallRecord::cancel_message() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancel_message_;
}

void CallRecord::set_cancel_hook(std::function<void()> hook) {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = std::move(hook);
}

void CallRecord::clear_cancel_hook() {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    cancel_hook_ = nullptr;
}

} // namespace streamrpc
