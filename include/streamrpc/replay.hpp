#pragma once
#include "event.hpp"
#include "session.hpp"
#include <chrono>
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace streamrpc {

/// Bounded, append-only record of one call's events. The dispatcher
/// appends; resuming readers take snapshots from a sequence offset.
class ReplayBuffer {
public:
    explicit ReplayBuffer(size_t capacity);

    /// Append the next event. Events after the terminal one are ignored.
    void append(StreamEvent event, Clock::time_point now = Clock::now());

    /// Retained events with sequence > `after`. Throws ResumeUnavailable if
    /// any of them has already been dropped or the buffer was released.
    [[nodiscard]] std::vector<StreamEvent> read_after(int64_t after) const;

    /// Wait until an event past `after` exists, the buffer is terminal, or
    /// the buffer is released. False on timeout.
    bool wait_after(int64_t after, std::chrono::milliseconds timeout) const;

    /// Wake readers and refuse further reads.
    void release();

    bool terminal() const;
    bool released() const;
    std::optional<Clock::time_point> terminated_at() const;

    /// -1 when nothing was appended yet.
    int64_t last_sequence() const;
    size_t size() const;
    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    std::deque<StreamEvent> events_;
    int64_t last_sequence_ = -1;
    int64_t dropped_through_ = -1;
    std::optional<Clock::time_point> terminated_at_;
    bool released_ = false;
};

/// Lazy continuation of a call's events past a given sequence number.
class ReplayCursor {
public:
    ReplayCursor(std::shared_ptr<const ReplayBuffer> buffer, int64_t last_seen);

    /// Next event, waiting up to `wait` for the producer. nullopt on timeout
    /// or once done(). Throws ResumeUnavailable if the buffer was released
    /// or overrun before the event could be read.
    std::optional<StreamEvent> next(std::chrono::milliseconds wait = std::chrono::milliseconds(0));

    /// True once the terminal event has been handed out, or when nothing
    /// remains after last_seen in a terminal buffer.
    bool done() const;

    int64_t last_seen() const { return last_seen_; }

private:
    std::shared_ptr<const ReplayBuffer> buffer_;
    int64_t last_seen_;
    std::deque<StreamEvent> pending_;
    bool delivered_terminal_ = false;
};

class ResumeRegistry {
public:
    struct Options {
        size_t capacity = 1024;
        std::chrono::milliseconds grace{std::chrono::seconds(30)};
    };

    ResumeRegistry();
    explicit ResumeRegistry(Options opts);

    ResumeRegistry(const ResumeRegistry&) = delete;
    ResumeRegistry& operator=(const ResumeRegistry&) = delete;

    /// Create (or replace) the buffer for a call.
    std::shared_ptr<ReplayBuffer> open(const std::string& session_id, const std::string& call_key);

    /// Throws ResumeUnavailable if the call is unknown, evicted, past its
    /// grace period, or if events after `last_seen` were already dropped.
    [[nodiscard]] ReplayCursor resume(const std::string& session_id,
                                      const std::string& call_key,
                                      int64_t last_seen,
                                      Clock::time_point now = Clock::now()) const;

    void release(const std::string& session_id, const std::string& call_key);
    size_t release_session(const std::string& session_id);

    /// Drop terminal buffers whose grace period has passed.
    size_t evict_expired(Clock::time_point now = Clock::now());

    void clear();
    size_t size() const;

private:
    using Key = std::pair<std::string, std::string>;

    bool past_grace(const ReplayBuffer& buffer, Clock::time_point now) const;

    Options opts_;
    mutable std::mutex mutex_;
    std::map<Key, std::shared_ptr<ReplayBuffer>> buffers_;
};

} // namespace streamrpc
