#pragma once
#include "transport.hpp"
#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

// httplib.h stays out of public headers.
namespace httplib {
    class Server;
    struct Request;
    struct Response;
}

namespace streamrpc {

/// Streamable HTTP endpoint: POST carries calls, GET resumes a call's
/// event stream from Last-Event-ID, DELETE ends a session.
class HttpServerTransport : public ITransport {
public:
    struct Options {
        std::string host = "127.0.0.1";
        uint16_t port = 8080;
        std::string path = "/mcp";
        std::vector<std::string> allowed_origins;
        int max_connections = 100;
        /// How long a resumed stream waits for the producer before sending
        /// a keep-alive comment.
        std::chrono::milliseconds keep_alive_interval{std::chrono::seconds(15)};
    };

    explicit HttpServerTransport(Options opts);
    ~HttpServerTransport() override;

    void start(CallDispatcher& dispatcher) override;
    void shutdown() override;
    bool is_connected() const override;

    uint16_t port() const { return opts_.port; }

private:
    bool validate_origin(const std::string& origin) const;
    void setup_routes();
    void handle_post(const httplib::Request& req, httplib::Response& res);
    void handle_resume(const httplib::Request& req, httplib::Response& res);
    void handle_delete(const httplib::Request& req, httplib::Response& res);

    Options opts_;
    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    CallDispatcher* dispatcher_{nullptr};
};

} // namespace streamrpc
