#pragma once
#include <nlohmann/json.hpp>
#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace streamrpc {

/// Finite, ordered, non-restartable producer of payload fragments.
class FragmentSource {
public:
    virtual ~FragmentSource() = default;

    /// Next fragment, or nullopt once the source is exhausted. Failures are
    /// reported by throwing (HandlerFailure for typed errors).
    virtual std::optional<nlohmann::json> next() = 0;

    /// Ask the producer to stop. Called from another thread; must not block.
    virtual void cancel() {}
};

class VectorSource : public FragmentSource {
public:
    explicit VectorSource(std::vector<nlohmann::json> fragments);

    std::optional<nlohmann::json> next() override;
    void cancel() override;

private:
    std::vector<nlohmann::json> fragments_;
    size_t index_ = 0;
    std::atomic<bool> cancelled_{false};
};

/// Pulls from a callable until it returns nullopt.
class GeneratorSource : public FragmentSource {
public:
    using Generator = std::function<std::optional<nlohmann::json>()>;

    explicit GeneratorSource(Generator gen);

    std::optional<nlohmann::json> next() override;
    void cancel() override;

private:
    Generator gen_;
    bool exhausted_ = false;
    std::atomic<bool> cancelled_{false};
};

/// Thread-to-thread channel: a producer pushes fragments, the dispatcher
/// pulls them. next() blocks until a fragment, close, failure or cancel.
class FragmentChannel : public FragmentSource {
public:
    /// False once the consumer cancelled; the producer should stop.
    bool push(nlohmann::json fragment);
    void close();
    void fail(std::exception_ptr error);

    bool is_cancelled() const { return cancelled_; }

    std::optional<nlohmann::json> next() override;
    void cancel() override;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<nlohmann::json> queue_;
    bool closed_ = false;
    std::exception_ptr error_;
    std::atomic<bool> cancelled_{false};
};

/// Dispatcher-side handle on a channel shared with a producer thread, so
/// the channel outlives whichever side finishes first.
class ChannelSource : public FragmentSource {
public:
    explicit ChannelSource(std::shared_ptr<FragmentChannel> channel)
        : channel_(std::move(channel)) {}

    std::optional<nlohmann::json> next() override { return channel_->next(); }
    void cancel() override { channel_->cancel(); }

private:
    std::shared_ptr<FragmentChannel> channel_;
};

} // namespace streamrpc
