#pragma once
#include "event.hpp"
#include "json_rpc.hpp"
#include "negotiator.hpp"
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace streamrpc {

/// What came back for one call, in whichever mode the server chose.
struct CallOutcome {
    std::string session_id;
    ResponseMode mode = ResponseMode::Immediate;
    std::optional<JsonRpcResponse> response;
    std::vector<StreamEvent> events;

    /// An immediate response arrived, or the stream reached end/error.
    [[nodiscard]] bool complete() const;
    /// Content payloads of a streamed call, in sequence order.
    [[nodiscard]] std::vector<nlohmann::json> fragments() const;
    [[nodiscard]] std::optional<JsonRpcError> error() const;
};

/// Client side of the streamable HTTP endpoint. Keeps the session token
/// issued by the server and sends it on every later request.
class HttpClient {
public:
    struct Options {
        bool streaming = true;
        bool resume = true;
        std::chrono::seconds connect_timeout{10};
        std::chrono::seconds read_timeout{60};
    };

    /// Return false to stop reading; the connection is dropped.
    using EventCallback = std::function<bool(const StreamEvent&)>;

    explicit HttpClient(const std::string& url);
    HttpClient(const std::string& url, Options opts);
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// Throws ProtocolViolation when the server rejects the call,
    /// TimeoutError when no answer arrives within read_timeout and
    /// TransportError when the request otherwise fails.
    CallOutcome call(const std::string& method,
                     nlohmann::json params = nlohmann::json::object(),
                     EventCallback on_event = nullptr);
    CallOutcome call(const JsonRpcRequest& request, EventCallback on_event = nullptr);

    /// Continue a streamed call after `last_seen`. Throws ResumeUnavailable.
    CallOutcome resume(const RequestId& call_id, int64_t last_seen,
                       EventCallback on_event = nullptr);

    void cancel(const RequestId& call_id, const std::string& reason = "cancelled by caller");

    /// False if the server did not know the session.
    bool close_session();

    [[nodiscard]] std::string session_id() const;
    void set_session_id(std::string id);

    [[nodiscard]] RequestId next_id();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace streamrpc
