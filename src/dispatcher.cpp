#include "streamrpc/dispatcher.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/logging.hpp"

namespace streamrpc {

// ---------- MemorySink ----------

bool MemorySink::write(const StreamEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (limit_ && events_.size() >= *limit_) return false;
    events_.push_back(event);
    return true;
}

void MemorySink::disconnect_after(size_t n) {
    std::lock_guard<std::mutex> lock(mutex_);
    limit_ = n;
}

std::vector<StreamEvent> MemorySink::events() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_;
}

size_t MemorySink::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ---------- CallDispatcher ----------

CallDispatcher::CallDispatcher(Options opts, SessionStore& sessions, Router& router,
                               ResumeRegistry& replay)
    : opts_(std::move(opts)), sessions_(sessions), router_(router), replay_(replay) {
}

void CallDispatcher::set_policy(NegotiationPolicy policy) {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    opts_.policy = std::move(policy);
}

NegotiationPolicy CallDispatcher::policy() const {
    std::lock_guard<std::mutex> lock(policy_mutex_);
    return opts_.policy;
}

CallPlan CallDispatcher::accept(const InboundCall& call) {
    const JsonRpcRequest& req = call.request;
    if (req.params && !req.params->is_object() && !req.params->is_array()) {
        logging::logger()->warn("rejecting call {}: params must be an object or array",
                                to_key(req.id));
        throw ProtocolViolation(error::InvalidParams, "params must be an object or array");
    }

    auto now = Clock::now();
    CallPlan plan;
    plan.session = sessions_.resolve(call.meta.session_id, call.meta.accept.to_capabilities(), now);
    plan.request = req;

    std::string key = to_key(req.id);
    if (!plan.session->begin_call(key)) {
        logging::logger()->warn("session {}: call id '{}' reused", plan.session->id(), key);
        throw ProtocolViolation(error::InvalidRequest,
                                "Call id '" + key + "' was already used in this session");
    }

    plan.record = std::make_shared<CallRecord>(plan.session->id(), req.id, now);
    plan.mode = decide(policy(), plan.session->capabilities(), req, call.meta.accept);
    plan.record->set_state(CallState::Negotiated);
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        active_[CallKey{plan.session->id(), key}] = plan.record;
    }
    logging::logger()->debug("session {}: call {} '{}' -> {}", plan.session->id(), key,
                             req.method, to_string(plan.mode));
    return plan;
}

JsonRpcResponse CallDispatcher::run_immediate(const CallPlan& plan) {
    auto& record = *plan.record;
    record.set_state(CallState::Executing);

    CallContext ctx(plan.record);
    nlohmann::json params = plan.request.params.value_or(nlohmann::json::object());
    HandlerResult result = router_.invoke(plan.request.method, params, ctx);

    JsonRpcResponse resp;
    resp.id = plan.request.id;
    if (record.cancelled()) {
        resp.error = cancellation_error(record);
    } else if (auto* ok = std::get_if<nlohmann::json>(&result)) {
        resp.result = std::move(*ok);
    } else {
        resp.error = std::get<JsonRpcError>(result);
        logging::logger()->warn("call {} '{}' failed: {}", record.key(),
                                plan.request.method, resp.error->message);
    }

    record.finish(resp.error ? CallState::Failed : CallState::Completed);
    complete(plan);
    return resp;
}

void CallDispatcher::run_streamed(const CallPlan& plan, EventSink& sink) {
    auto record = plan.record;
    const auto& session = plan.session;

    std::shared_ptr<ReplayBuffer> buffer;
    if (session->capabilities().resume) {
        buffer = replay_.open(session->id(), record->key());
    }

    int64_t sequence = 0;
    bool sink_alive = true;
    auto emit = [&](EventKind kind, nlohmann::json payload) {
        StreamEvent ev{plan.request.id, sequence++, kind, std::move(payload)};
        auto now = Clock::now();
        record->touch(now);
        session->touch(now);
        if (buffer) buffer->append(ev, now);
        if (!sink_alive) return;

        bool written = false;
        try {
            written = sink.write(ev);
        } catch (const std::exception& e) {
            logging::logger()->warn("call {}: sink write failed: {}", record->key(), e.what());
        }
        if (!written) {
            sink_alive = false;
            if (buffer) {
                logging::logger()->info("call {}: consumer gone, buffering for resume",
                                        record->key());
            } else {
                record->cancel(CancelReason::Disconnected, "client disconnected");
            }
        }
    };

    emit(EventKind::Start, nlohmann::json{{"session", session->id()}});
    record->set_state(CallState::Executing);

    CallContext ctx(record);
    nlohmann::json params = plan.request.params.value_or(nlohmann::json::object());
    std::optional<JsonRpcError> failure;
    {
        std::unique_ptr<FragmentSource> source;
        try {
            source = router_.open_stream(plan.request.method, params, ctx);
            FragmentSource* raw = source.get();
            record->set_cancel_hook([raw] { raw->cancel(); });
            while (!record->cancelled()) {
                auto fragment = source->next();
                if (!fragment || record->cancelled()) break;
                emit(EventKind::Content, std::move(*fragment));
            }
        } catch (const HandlerFailure& e) {
            failure = JsonRpcError{e.code, e.what(), e.data};
        } catch (const std::exception& e) {
            failure = JsonRpcError{error::HandlerFailed, e.what(), std::nullopt};
        }
        // The hook holds a raw pointer to the source; drop it first.
        record->clear_cancel_hook();
    }

    if (record->cancelled()) {
        failure = cancellation_error(*record);
    }
    if (failure) {
        logging::logger()->warn("call {} '{}' failed: {}", record->key(),
                                plan.request.method, failure->message);
        record->finish(CallState::Failed);
        nlohmann::json payload;
        to_json(payload, *failure);
        emit(EventKind::Error, std::move(payload));
    } else {
        record->finish(CallState::Completed);
        emit(EventKind::End, nullptr);
    }
    complete(plan);
}

DispatchResult CallDispatcher::dispatch(const InboundCall& call, EventSink& sink) {
    CallPlan plan = accept(call);
    DispatchResult result;
    result.session_id = plan.session->id();
    result.mode = plan.mode;
    if (plan.mode == ResponseMode::Immediate) {
        result.response = run_immediate(plan);
    } else {
        run_streamed(plan, sink);
    }
    return result;
}

void CallDispatcher::complete(const CallPlan& plan) {
    plan.session->finish_call(plan.record->key());
    plan.session->touch(Clock::now());
    std::lock_guard<std::mutex> lock(calls_mutex_);
    auto it = active_.find(CallKey{plan.session->id(), plan.record->key()});
    if (it != active_.end() && it->second == plan.record) active_.erase(it);
}

JsonRpcError CallDispatcher::cancellation_error(const CallRecord& record) {
    if (record.cancel_reason() == CancelReason::Timeout) {
        return JsonRpcError{error::CallTimeout, "Call timed out: " + record.cancel_message(),
                            std::nullopt};
    }
    return JsonRpcError{error::CallCancelled, "Call cancelled: " + record.cancel_message(),
                        std::nullopt};
}

bool CallDispatcher::cancel(const std::string& session_id, const RequestId& call_id,
                            const std::string& reason) {
    std::shared_ptr<CallRecord> record;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = active_.find(CallKey{session_id, to_key(call_id)});
        if (it == active_.end()) return false;
        record = it->second;
    }
    bool cancelled = record->cancel(CancelReason::Requested, reason);
    if (cancelled) {
        logging::logger()->info("session {}: call {} cancelled ({})", session_id,
                                record->key(), reason);
    }
    return cancelled;
}

ReplayCursor CallDispatcher::resume(const std::string& session_id,
                                    const std::string& call_key,
                                    int64_t last_seen) {
    auto session = sessions_.find(session_id);
    if (!session) {
        throw ResumeUnavailable("Unknown session: " + session_id);
    }
    if (!session->capabilities().resume) {
        throw ResumeUnavailable("Resume was not negotiated for session " + session_id);
    }
    session->touch(Clock::now());
    return replay_.resume(session_id, call_key, last_seen);
}

size_t CallDispatcher::cancel_session_calls(const std::string& session_id, CancelReason reason,
                                            const std::string& message) {
    std::vector<std::shared_ptr<CallRecord>> records;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        auto it = active_.lower_bound(CallKey{session_id, std::string()});
        for (; it != active_.end() && it->first.first == session_id; ++it) {
            records.push_back(it->second);
        }
    }
    size_t count = 0;
    for (auto& r : records) {
        if (r->cancel(reason, message)) ++count;
    }
    return count;
}

bool CallDispatcher::close_session(const std::string& session_id) {
    if (!sessions_.remove(session_id)) return false;
    cancel_session_calls(session_id, CancelReason::Requested, "session closed");
    replay_.release_session(session_id);
    return true;
}

size_t CallDispatcher::reap_idle_calls(Clock::time_point now) {
    std::vector<std::shared_ptr<CallRecord>> idle;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (const auto& [key, record] : active_) {
            if (!record->is_terminal() && now - record->last_activity() > opts_.call_idle_timeout) {
                idle.push_back(record);
            }
        }
    }
    size_t count = 0;
    for (auto& record : idle) {
        auto idle_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now - record->last_activity()).count();
        if (record->cancel(CancelReason::Timeout,
                           "no activity for " + std::to_string(idle_ms) + " ms")) {
            replay_.release(record->session_id(), record->key());
            logging::logger()->info("session {}: call {} timed out", record->session_id(),
                                    record->key());
            ++count;
        }
    }
    return count;
}

SweepStats CallDispatcher::sweep(Clock::time_point now) {
    SweepStats stats;
    for (const auto& id : sessions_.expire(now)) {
        cancel_session_calls(id, CancelReason::Timeout, "session expired");
        replay_.release_session(id);
        ++stats.sessions_expired;
    }
    stats.calls_reaped = reap_idle_calls(now);
    stats.buffers_evicted = replay_.evict_expired(now);
    return stats;
}

void CallDispatcher::shutdown() {
    std::vector<std::shared_ptr<CallRecord>> records;
    {
        std::lock_guard<std::mutex> lock(calls_mutex_);
        for (const auto& [key, record] : active_) records.push_back(record);
    }
    for (auto& r : records) r->cancel(CancelReason::Requested, "server shutting down");
    replay_.clear();
    sessions_.clear();
}

size_t CallDispatcher::active_calls() const {
    std::lock_guard<std::mutex> lock(calls_mutex_);
    return active_.size();
}

} // namespace streamrpc
