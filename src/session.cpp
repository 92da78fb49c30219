#include "streamrpc/session.hpp"
#include "streamrpc/logging.hpp"
#include <algorithm>
#include <iomanip>
#include <random>
#include <sstream>

namespace streamrpc {

std::string generate_session_id() {
    thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;
    uint64_t a = dis(gen), b = dis(gen);
    a = (a & 0xFFFFFFFFFFFF0FFFull) | 0x0000000000004000ull;
    b = (b & 0x3FFFFFFFFFFFFFFFull) | 0x8000000000000000ull;
    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8)  << (a >> 32);
    oss << "-" << std::setw(4) << ((a >> 16) & 0xFFFF);
    oss << "-" << std::setw(4) << (a & 0xFFFF);
    oss << "-" << std::setw(4) << (b >> 48);
    oss << "-" << std::setw(12) << (b & 0xFFFFFFFFFFFFull);
    return oss.str();
}

// ---------- Session ----------

Session::Session(std::string id, Capabilities caps, Clock::time_point now,
                 size_t terminal_limit)
    : id_(std::move(id)), caps_(caps), created_at_(now)
    , terminal_limit_(std::max<size_t>(terminal_limit, 1)), last_active_at_(now) {
}

Clock::time_point Session::last_active_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_active_at_;
}

void Session::touch(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (now > last_active_at_) last_active_at_ = now;
}

bool Session::begin_call(const std::string& call_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.count(call_key) || terminal_.count(call_key)) return false;
    in_flight_.insert(call_key);
    return true;
}

void Session::finish_call(const std::string& call_key) {
    std::lock_guard<std::mutex> lock(mutex_);
    in_flight_.erase(call_key);
    if (!terminal_.insert(call_key).second) return;
    terminal_order_.push_back(call_key);
    while (terminal_order_.size() > terminal_limit_) {
        terminal_.erase(terminal_order_.front());
        terminal_order_.pop_front();
    }
}

CallStatus Session::call_status(const std::string& call_key) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (in_flight_.count(call_key)) return CallStatus::InFlight;
    if (terminal_.count(call_key)) return CallStatus::Terminal;
    return CallStatus::Unknown;
}

size_t Session::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return in_flight_.size();
}

size_t Session::terminal_calls() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return terminal_.size();
}

// ---------- SessionStore ----------

SessionStore::SessionStore() : SessionStore(Options{}) {}

SessionStore::SessionStore(Options opts) : opts_(opts) {}

bool SessionStore::is_idle(const Session& s, Clock::time_point now) const {
    return now - s.last_active_at() > opts_.idle_timeout;
}

std::shared_ptr<Session> SessionStore::resolve(const std::optional<std::string>& id,
                                               const Capabilities& declared,
                                               Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (id && !id->empty()) {
        auto it = sessions_.find(*id);
        if (it != sessions_.end()) {
            if (!is_idle(*it->second, now)) {
                it->second->touch(now);
                return it->second;
            }
            logging::logger()->debug("session {} idle past timeout, replacing", *id);
            sessions_.erase(it);
        } else {
            logging::logger()->debug("unknown session {}, creating a new one", *id);
        }
    }

    std::string new_id = generate_session_id();
    while (sessions_.count(new_id)) new_id = generate_session_id();
    auto session = std::make_shared<Session>(new_id, declared, now, opts_.terminal_limit);
    sessions_.emplace(new_id, session);
    logging::logger()->info("session {} created (streaming={}, resume={})",
                            new_id, declared.streaming, declared.resume);
    return session;
}

std::shared_ptr<Session> SessionStore::find(const std::string& id, Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sessions_.find(id);
    if (it == sessions_.end() || is_idle(*it->second, now)) return nullptr;
    return it->second;
}

std::vector<std::string> SessionStore::expire(Clock::time_point now) {
    std::vector<std::string> expired;
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = sessions_.begin(); it != sessions_.end(); ) {
        if (is_idle(*it->second, now)) {
            expired.push_back(it->first);
            it = sessions_.erase(it);
        } else {
            ++it;
        }
    }
    if (!expired.empty()) {
        logging::logger()->info("expired {} idle session(s)", expired.size());
    }
    return expired;
}

bool SessionStore::remove(const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (sessions_.erase(id) == 0) return false;
    logging::logger()->info("session {} closed", id);
    return true;
}

void SessionStore::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    sessions_.clear();
}

size_t SessionStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sessions_.size();
}

} // namespace streamrpc
