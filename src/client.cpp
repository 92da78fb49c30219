#include "streamrpc/client.hpp"
#include "streamrpc/codec.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/event_framer.hpp"
#include "streamrpc/logging.hpp"
#include "streamrpc/version.hpp"

#include <httplib.h>

#include <atomic>
#include <chrono>
#include <exception>
#include <mutex>

namespace streamrpc {

// ---------- CallOutcome ----------

bool CallOutcome::complete() const {
    if (mode == ResponseMode::Immediate) return response.has_value();
    return !events.empty() && is_terminal(events.back().kind);
}

std::vector<nlohmann::json> CallOutcome::fragments() const {
    std::vector<nlohmann::json> out;
    for (const auto& ev : events) {
        if (ev.kind == EventKind::Content) out.push_back(ev.payload);
    }
    return out;
}

std::optional<JsonRpcError> CallOutcome::error() const {
    if (response && response->error) return response->error;
    for (const auto& ev : events) {
        if (ev.kind == EventKind::Error) return ev.payload.get<JsonRpcError>();
    }
    return std::nullopt;
}

// ---------- HttpClient::Impl ----------

struct HttpClient::Impl {
    Options opts;
    std::string origin;
    std::string path;

    mutable std::mutex session_mutex;
    std::string session_id;
    std::atomic<int64_t> next_id{1};

    Impl(const std::string& url, Options o) : opts(std::move(o)) {
        // Support http://host:port/path
        std::string rest = url;
        if (rest.substr(0, 7) == "http://") rest = rest.substr(7);
        auto slash = rest.find('/');
        std::string hostport = (slash == std::string::npos) ? rest : rest.substr(0, slash);
        path = (slash == std::string::npos) ? "/" : rest.substr(slash);
        origin = "http://" + hostport;
    }

    std::unique_ptr<httplib::Client> make_client() const {
        // One connection per exchange, so cancel() can run beside a stream.
        auto client = std::make_unique<httplib::Client>(origin);
        client->set_connection_timeout(static_cast<time_t>(opts.connect_timeout.count()));
        client->set_read_timeout(static_cast<time_t>(opts.read_timeout.count()));
        return client;
    }

    std::string current_session() const {
        std::lock_guard<std::mutex> lock(session_mutex);
        return session_id;
    }

    void remember_session(const std::string& id) {
        if (id.empty()) return;
        std::lock_guard<std::mutex> lock(session_mutex);
        session_id = id;
    }

    httplib::Headers base_headers() const {
        httplib::Headers headers = {
            {"MCP-Protocol-Version", std::string(PROTOCOL_VERSION)}
        };
        auto sid = current_session();
        if (!sid.empty()) headers.emplace(header::SessionId, sid);
        return headers;
    }

    [[noreturn]] static void raise_for_status(int status, const std::string& body) {
        int code = error::InternalError;
        std::string message = "HTTP error: " + std::to_string(status);
        try {
            auto j = Codec::parse_json(body);
            if (j.contains("error")) {
                code = j["error"].value("code", code);
                message = j["error"].value("message", message);
            }
        } catch (const std::exception&) {
            // Not a JSON-RPC error body; keep the status line.
        }
        if (status == 404 && code == error::ResumeUnavailable) throw ResumeUnavailable(message);
        if (code == error::ParseError) throw ParseError(message);
        if (status == 400 || status == 409) throw ProtocolViolation(code, message);
        throw TransportError(message);
    }

    /// A read that failed after the whole read timeout elapsed is a timeout;
    /// anything else is a transport failure.
    [[noreturn]] void raise_for_error(const std::string& what, httplib::Error err,
                                      std::chrono::steady_clock::time_point started) const {
        std::string message = "HTTP " + what + " failed: " + httplib::to_string(err);
        if (err == httplib::Error::Read &&
            std::chrono::steady_clock::now() - started >= opts.read_timeout) {
            throw TimeoutError(message);
        }
        throw TransportError(message);
    }

    CallOutcome exchange(httplib::Request& req, const EventCallback& on_event) {
        CallOutcome out;
        int status = 0;
        bool streaming = false;
        bool stopped = false;
        std::string body;
        EventDecoder decoder;
        std::exception_ptr failure;

        req.response_handler = [&](const httplib::Response& res) {
            status = res.status;
            remember_session(res.get_header_value(header::SessionId));
            streaming = status == 200 &&
                res.get_header_value("Content-Type").find(content_type::EventStream) !=
                    std::string::npos;
            return true;
        };
        req.content_receiver = [&](const char* data, size_t len, uint64_t, uint64_t) {
            if (!streaming) {
                body.append(data, len);
                return true;
            }
            try {
                decoder.feed(std::string_view(data, len));
                for (;;) {
                    auto result = decoder.decode();
                    auto* ev = std::get_if<StreamEvent>(&result);
                    if (!ev) return true;
                    out.events.push_back(*ev);
                    if (on_event && !on_event(out.events.back())) {
                        stopped = true;
                        return false;
                    }
                }
            } catch (...) {
                failure = std::current_exception();
                return false;
            }
        };

        auto client = make_client();
        auto started = std::chrono::steady_clock::now();
        auto result = client->send(req);
        if (failure) std::rethrow_exception(failure);
        if (!result && !stopped) raise_for_error(req.method, result.error(), started);

        out.session_id = current_session();
        if (streaming) {
            out.mode = ResponseMode::Streamed;
            return out;
        }
        if (status >= 400) raise_for_status(status, body);
        if (body.empty()) return out;

        auto msg = Codec::parse(body);
        if (auto* resp = std::get_if<JsonRpcResponse>(&msg)) {
            out.response = std::move(*resp);
            return out;
        }
        throw TransportError("Server answered with something other than a response");
    }
};

// ---------- HttpClient ----------

HttpClient::HttpClient(const std::string& url) : HttpClient(url, Options{}) {}

HttpClient::HttpClient(const std::string& url, Options opts)
    : impl_(std::make_unique<Impl>(url, std::move(opts))) {
}

HttpClient::~HttpClient() = default;

std::string HttpClient::session_id() const {
    return impl_->current_session();
}

void HttpClient::set_session_id(std::string id) {
    std::lock_guard<std::mutex> lock(impl_->session_mutex);
    impl_->session_id = std::move(id);
}

RequestId HttpClient::next_id() {
    return RequestId{impl_->next_id.fetch_add(1)};
}

CallOutcome HttpClient::call(const std::string& method, nlohmann::json params,
                             EventCallback on_event) {
    JsonRpcRequest request;
    request.id = next_id();
    request.method = method;
    request.params = std::move(params);
    return call(request, std::move(on_event));
}

CallOutcome HttpClient::call(const JsonRpcRequest& request, EventCallback on_event) {
    httplib::Request req;
    req.method = "POST";
    req.path = impl_->path;
    req.headers = impl_->base_headers();
    req.set_header("Content-Type", content_type::Json);
    req.set_header("Accept", impl_->opts.streaming ? "application/json, text/event-stream"
                                                   : "application/json");
    if (!impl_->opts.resume) req.set_header(header::Resume, "off");
    req.body = Codec::serialize(request);

    logging::logger()->debug("POST {} '{}'", to_key(request.id), request.method);
    return impl_->exchange(req, on_event);
}

CallOutcome HttpClient::resume(const RequestId& call_id, int64_t last_seen,
                               EventCallback on_event) {
    httplib::Request req;
    req.method = "GET";
    req.path = impl_->path;
    req.headers = impl_->base_headers();
    req.set_header("Accept", content_type::EventStream);
    req.set_header(header::LastEventId, EventEncoder::event_id(call_id, last_seen));

    logging::logger()->debug("resuming {} after {}", to_key(call_id), last_seen);
    return impl_->exchange(req, on_event);
}

void HttpClient::cancel(const RequestId& call_id, const std::string& reason) {
    nlohmann::json id_j;
    to_json(id_j, call_id);
    JsonRpcNotification notif;
    notif.method = "notifications/cancelled";
    notif.params = nlohmann::json{{"requestId", id_j}, {"reason", reason}};

    auto client = impl_->make_client();
    auto started = std::chrono::steady_clock::now();
    auto result = client->Post(impl_->path, impl_->base_headers(), Codec::serialize(notif),
                               content_type::Json);
    if (!result) impl_->raise_for_error("POST", result.error(), started);
    if (result->status >= 400) {
        Impl::raise_for_status(result->status, result->body);
    }
}

bool HttpClient::close_session() {
    if (session_id().empty()) return false;
    auto client = impl_->make_client();
    auto started = std::chrono::steady_clock::now();
    auto result = client->Delete(impl_->path, impl_->base_headers());
    if (!result) impl_->raise_for_error("DELETE", result.error(), started);
    set_session_id("");
    if (result->status == 404) return false;
    if (result->status >= 400) {
        Impl::raise_for_status(result->status, result->body);
    }
    return true;
}

} // namespace streamrpc
