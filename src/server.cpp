#include "streamrpc/server.hpp"
#include "streamrpc/logging.hpp"
#include "streamrpc/replay.hpp"
#include "streamrpc/transport/http_transport.hpp"

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace streamrpc {

namespace {

NegotiationPolicy policy_from(const EngineConfig& config) {
    NegotiationPolicy policy;
    policy.stream_threshold_bytes = config.stream_threshold_bytes;
    policy.streamed_methods = config.streamed_methods;
    policy.immediate_methods = config.immediate_methods;
    return policy;
}

} // namespace

// ----------- StreamServer::Impl -----------

struct StreamServer::Impl {
    EngineConfig config;
    SessionStore sessions;
    Router router;
    ResumeRegistry replay;
    CallDispatcher dispatcher;

    // Transport reference for shutdown from other threads
    ITransport* transport{nullptr};
    std::mutex transport_mutex;
    bool stop_requested{false};

    std::atomic<bool> running{false};

    // Sweeper
    std::thread sweeper;
    std::mutex sweep_mutex;
    std::condition_variable sweep_cv;
    bool sweeping{false};

    explicit Impl(EngineConfig c)
        : config(std::move(c))
        , sessions(SessionStore::Options{config.session_idle_timeout})
        , replay(ResumeRegistry::Options{config.replay_capacity, config.replay_grace})
        , dispatcher(CallDispatcher::Options{policy_from(config), config.call_idle_timeout},
                     sessions, router, replay) {}

    void start_sweeper() {
        {
            std::lock_guard<std::mutex> lock(sweep_mutex);
            sweeping = true;
        }
        sweeper = std::thread([this] {
            std::unique_lock<std::mutex> lock(sweep_mutex);
            while (sweeping) {
                if (sweep_cv.wait_for(lock, config.sweep_interval, [this] { return !sweeping; })) {
                    break;
                }
                lock.unlock();
                run_sweep();
                lock.lock();
            }
        });
    }

    void stop_sweeper() {
        {
            std::lock_guard<std::mutex> lock(sweep_mutex);
            sweeping = false;
        }
        sweep_cv.notify_all();
        if (sweeper.joinable()) sweeper.join();
    }

    SweepStats run_sweep() {
        auto stats = dispatcher.sweep(Clock::now());
        if (stats.sessions_expired || stats.calls_reaped || stats.buffers_evicted) {
            logging::logger()->debug("sweep: {} sessions expired, {} calls timed out, "
                                     "{} replay buffers evicted",
                                     stats.sessions_expired, stats.calls_reaped,
                                     stats.buffers_evicted);
        }
        return stats;
    }
};

// ----------- StreamServer -----------

StreamServer::StreamServer(EngineConfig config)
    : impl_(std::make_unique<Impl>(std::move(config))) {
}

StreamServer::~StreamServer() {
    shutdown();
}

void StreamServer::add_method(const std::string& name, CallHandler handler) {
    impl_->router.on_call(name, std::move(handler));
}

void StreamServer::add_streaming_method(const std::string& name, StreamHandler handler,
                                        bool always_stream) {
    impl_->router.on_stream(name, std::move(handler));
    if (always_stream) {
        auto policy = impl_->dispatcher.policy();
        policy.streamed_methods.insert(name);
        impl_->dispatcher.set_policy(std::move(policy));
    }
}

void StreamServer::remove_method(const std::string& name) {
    impl_->router.remove(name);
    auto policy = impl_->dispatcher.policy();
    if (policy.streamed_methods.erase(name)) {
        impl_->dispatcher.set_policy(std::move(policy));
    }
}

void StreamServer::serve(std::unique_ptr<ITransport> transport) {
    auto* t = transport.get();
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        if (impl_->stop_requested) return;
        impl_->transport = t;
    }
    impl_->running = true;
    impl_->start_sweeper();

    try {
        t->start(impl_->dispatcher);
    } catch (...) {
        impl_->stop_sweeper();
        impl_->running = false;
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->transport = nullptr;
        throw;
    }

    impl_->stop_sweeper();
    impl_->running = false;
    std::lock_guard<std::mutex> lock(impl_->transport_mutex);
    impl_->transport = nullptr;
}

void StreamServer::serve_http() {
    HttpServerTransport::Options opts;
    opts.host = impl_->config.host;
    opts.port = impl_->config.port;
    opts.path = impl_->config.path;
    opts.allowed_origins = impl_->config.allowed_origins;
    serve(std::make_unique<HttpServerTransport>(opts));
}

void StreamServer::serve_http(const std::string& host, uint16_t port) {
    impl_->config.host = host;
    impl_->config.port = port;
    serve_http();
}

void StreamServer::shutdown() {
    {
        std::lock_guard<std::mutex> lock(impl_->transport_mutex);
        impl_->stop_requested = true;
        if (impl_->transport) {
            impl_->transport->shutdown();
        }
    }
    impl_->dispatcher.shutdown();
}

bool StreamServer::is_running() const {
    return impl_->running;
}

SweepStats StreamServer::sweep() {
    return impl_->run_sweep();
}

const EngineConfig& StreamServer::config() const {
    return impl_->config;
}

CallDispatcher& StreamServer::dispatcher() {
    return impl_->dispatcher;
}

Router& StreamServer::router() {
    return impl_->router;
}

SessionStore& StreamServer::sessions() {
    return impl_->sessions;
}

} // namespace streamrpc
