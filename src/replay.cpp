#include "streamrpc/replay.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/logging.hpp"

namespace streamrpc {

// ---------- ReplayBuffer ----------

ReplayBuffer::ReplayBuffer(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void ReplayBuffer::append(StreamEvent event, Clock::time_point now) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (terminated_at_ || released_) return;
        if (event.sequence <= last_sequence_) return;
        last_sequence_ = event.sequence;
        if (is_terminal(event.kind)) terminated_at_ = now;
        events_.push_back(std::move(event));
        while (events_.size() > capacity_) {
            dropped_through_ = events_.front().sequence;
            events_.pop_front();
        }
    }
    cv_.notify_all();
}

std::vector<StreamEvent> ReplayBuffer::read_after(int64_t after) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (released_) {
        throw ResumeUnavailable("Replay buffer released");
    }
    if (after < dropped_through_) {
        throw ResumeUnavailable("Events after sequence " + std::to_string(after) +
                                " are no longer buffered");
    }
    std::vector<StreamEvent> out;
    for (const auto& ev : events_) {
        if (ev.sequence > after) out.push_back(ev);
    }
    return out;
}

bool ReplayBuffer::wait_after(int64_t after, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] {
        return last_sequence_ > after || terminated_at_.has_value() || released_;
    });
}

void ReplayBuffer::release() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released_ = true;
        events_.clear();
    }
    cv_.notify_all();
}

bool ReplayBuffer::terminal() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_at_.has_value();
}

bool ReplayBuffer::released() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return released_;
}

std::optional<Clock::time_point> ReplayBuffer::terminated_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminated_at_;
}

int64_t ReplayBuffer::last_sequence() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_sequence_;
}

size_t ReplayBuffer::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

// ---------- ReplayCursor ----------

ReplayCursor::ReplayCursor(std::shared_ptr<const ReplayBuffer> buffer, int64_t last_seen)
    : buffer_(std::move(buffer)), last_seen_(last_seen) {
}

std::optional<StreamEvent> ReplayCursor::next(std::chrono::milliseconds wait) {
    if (delivered_terminal_) return std::nullopt;

    if (pending_.empty()) {
        if (done()) return std::nullopt;
        if (buffer_->last_sequence() <= last_seen_ && !buffer_->terminal() && !buffer_->released()) {
            buffer_->wait_after(last_seen_, wait);
        }
        auto batch = buffer_->read_after(last_seen_);
        pending_.assign(batch.begin(), batch.end());
        if (pending_.empty()) return std::nullopt;
    }

    StreamEvent ev = std::move(pending_.front());
    pending_.pop_front();
    last_seen_ = ev.sequence;
    if (is_terminal(ev.kind)) {
        delivered_terminal_ = true;
        pending_.clear();
    }
    return ev;
}

bool ReplayCursor::done() const {
    if (delivered_terminal_) return true;
    return pending_.empty() && buffer_->terminal() && buffer_->last_sequence() <= last_seen_;
}

// ---------- ResumeRegistry ----------

ResumeRegistry::ResumeRegistry() : ResumeRegistry(Options{}) {}

ResumeRegistry::ResumeRegistry(Options opts) : opts_(opts) {}

bool ResumeRegistry::past_grace(const ReplayBuffer& buffer, Clock::time_point now) const {
    auto terminated = buffer.terminated_at();
    return terminated && now - *terminated > opts_.grace;
}

std::shared_ptr<ReplayBuffer> ResumeRegistry::open(const std::string& session_id,
                                                   const std::string& call_key) {
    auto buffer = std::make_shared<ReplayBuffer>(opts_.capacity);
    std::lock_guard<std::mutex> lock(mutex_);
    auto& slot = buffers_[Key{session_id, call_key}];
    if (slot) slot->release();
    slot = buffer;
    return buffer;
}

ReplayCursor ResumeRegistry::resume(const std::string& session_id,
                                    const std::string& call_key,
                                    int64_t last_seen,
                                    Clock::time_point now) const {
    std::shared_ptr<ReplayBuffer> buffer;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = buffers_.find(Key{session_id, call_key});
        if (it == buffers_.end()) {
            throw ResumeUnavailable("No replay state for call " + call_key);
        }
        buffer = it->second;
    }
    if (buffer->released() || past_grace(*buffer, now)) {
        throw ResumeUnavailable("Replay state for call " + call_key + " has expired");
    }
    // Surfaces an overrun before any event is handed out.
    (void)buffer->read_after(last_seen);
    return ReplayCursor(buffer, last_seen);
}

void ResumeRegistry::release(const std::string& session_id, const std::string& call_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buffers_.find(Key{session_id, call_key});
    if (it == buffers_.end()) return;
    it->second->release();
    buffers_.erase(it);
}

size_t ResumeRegistry::release_session(const std::string& session_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    auto it = buffers_.lower_bound(Key{session_id, std::string()});
    while (it != buffers_.end() && it->first.first == session_id) {
        it->second->release();
        it = buffers_.erase(it);
        ++count;
    }
    return count;
}

size_t ResumeRegistry::evict_expired(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (auto it = buffers_.begin(); it != buffers_.end(); ) {
        if (past_grace(*it->second, now)) {
            it->second->release();
            it = buffers_.erase(it);
            ++count;
        } else {
            ++it;
        }
    }
    if (count > 0) {
        logging::logger()->debug("evicted {} replay buffer(s)", count);
    }
    return count;
}

void ResumeRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [key, buffer] : buffers_) buffer->release();
    buffers_.clear();
}

size_t ResumeRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return buffers_.size();
}

} // namespace streamrpc
