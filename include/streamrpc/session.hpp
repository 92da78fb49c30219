#pragma once
#include <chrono>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace streamrpc {

using Clock = std::chrono::steady_clock;

/// Capability membership fixed when a session is created.
struct Capabilities {
    bool streaming = false;
    bool resume = false;

    bool operator==(const Capabilities& o) const {
        return streaming == o.streaming && resume == o.resume;
    }
};

enum class CallStatus {
    Unknown,
    InFlight,
    Terminal
};

/// One conversation. Terminal call ids are remembered so that reusing one
/// is rejected, but only the most recent `terminal_limit` of them: a
/// session is otherwise bounded by idle expiry alone, and an id older than
/// that window is accepted again.
class Session {
public:
    static constexpr size_t kDefaultTerminalLimit = 4096;

    Session(std::string id, Capabilities caps, Clock::time_point now,
            size_t terminal_limit = kDefaultTerminalLimit);

    const std::string& id() const { return id_; }
    const Capabilities& capabilities() const { return caps_; }
    Clock::time_point created_at() const { return created_at_; }

    Clock::time_point last_active_at() const;
    void touch(Clock::time_point now);

    /// Record a new call id. False if the id is already in flight or has
    /// already reached a terminal state in this session.
    bool begin_call(const std::string& call_key);

    /// Move an in-flight call to the terminal set, forgetting the oldest
    /// terminal id once the limit is exceeded.
    void finish_call(const std::string& call_key);

    CallStatus call_status(const std::string& call_key) const;
    size_t in_flight() const;
    size_t terminal_calls() const;

private:
    const std::string id_;
    const Capabilities caps_;
    const Clock::time_point created_at_;
    const size_t terminal_limit_;

    mutable std::mutex mutex_;
    Clock::time_point last_active_at_;
    std::set<std::string> in_flight_;
    std::set<std::string> terminal_;
    std::deque<std::string> terminal_order_;
};

class SessionStore {
public:
    struct Options {
        std::chrono::milliseconds idle_timeout{std::chrono::minutes(30)};
        /// Terminal call ids each session remembers for duplicate checks.
        size_t terminal_limit = Session::kDefaultTerminalLimit;
    };

    SessionStore();
    explicit SessionStore(Options opts);

    SessionStore(const SessionStore&) = delete;
    SessionStore& operator=(const SessionStore&) = delete;

    /// Return the live session for `id` and refresh its activity time.
    /// An absent, unknown or idle-expired id yields a fresh session whose
    /// capabilities are `declared`.
    [[nodiscard]] std::shared_ptr<Session> resolve(const std::optional<std::string>& id,
                                                   const Capabilities& declared,
                                                   Clock::time_point now = Clock::now());

    /// Live session lookup without refreshing. nullptr if unknown or idle.
    [[nodiscard]] std::shared_ptr<Session> find(const std::string& id,
                                                Clock::time_point now = Clock::now()) const;

    /// Drop sessions idle longer than the timeout. Returns their ids.
    std::vector<std::string> expire(Clock::time_point now = Clock::now());

    bool remove(const std::string& id);
    void clear();
    size_t size() const;

    std::chrono::milliseconds idle_timeout() const { return opts_.idle_timeout; }

private:
    bool is_idle(const Session& s, Clock::time_point now) const;

    Options opts_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

/// Random UUID v4 string.
std::string generate_session_id();

} // namespace streamrpc
