#include "streamrpc/transport/http_transport.hpp"
#include "streamrpc/codec.hpp"
#include "streamrpc/dispatcher.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/event_framer.hpp"
#include "streamrpc/logging.hpp"
#include "streamrpc/version.hpp"

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace streamrpc {

namespace {

void set_error(httplib::Response& res, int status, const std::optional<RequestId>& id,
               int code, const std::string& message) {
    nlohmann::json body;
    if (id) {
        to_json(body, make_error_response(*id, code, message));
    } else {
        body = {
            {"jsonrpc", std::string(JSONRPC_VERSION)},
            {"id", nullptr},
            {"error", {{"code", code}, {"message", message}}}
        };
    }
    res.status = status;
    res.set_content(body.dump(), content_type::Json);
}

bool is_batch(const std::string& body) {
    auto it = std::find_if(body.begin(), body.end(),
                           [](unsigned char c) { return !std::isspace(c); });
    return it != body.end() && *it == '[';
}

/// Frames events onto a chunked HTTP response.
class HttpEventSink : public EventSink {
public:
    explicit HttpEventSink(httplib::DataSink& sink) : sink_(sink) {}

    bool write(const StreamEvent& event) override {
        std::string unit = EventEncoder::encode(event);
        return sink_.write(unit.data(), unit.size());
    }

private:
    httplib::DataSink& sink_;
};

/// Stands in for a consumer that never read anything.
class ClosedSink : public EventSink {
public:
    bool write(const StreamEvent&) override { return false; }
};

} // namespace

HttpServerTransport::HttpServerTransport(Options opts)
    : opts_(std::move(opts))
    , server_(std::make_unique<httplib::Server>()) {
    int workers = std::max(opts_.max_connections, 1);
    server_->new_task_queue = [workers] { return new httplib::ThreadPool(workers); };
}

HttpServerTransport::~HttpServerTransport() {
    shutdown();
}

bool HttpServerTransport::validate_origin(const std::string& origin) const {
    if (opts_.allowed_origins.empty()) return true;
    for (const auto& allowed : opts_.allowed_origins) {
        if (origin == allowed) return true;
    }
    return false;
}

void HttpServerTransport::setup_routes() {
    const std::string path = opts_.path;

    server_->Post(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_post(req, res);
    });
    server_->Get(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_resume(req, res);
    });
    server_->Delete(path, [this](const httplib::Request& req, httplib::Response& res) {
        handle_delete(req, res);
    });
}

void HttpServerTransport::handle_post(const httplib::Request& req, httplib::Response& res) {
    // Browsers send Origin; reject foreign pages driving a local server.
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        set_error(res, 403, std::nullopt, error::InvalidRequest, "Invalid origin");
        return;
    }
    if (is_batch(req.body)) {
        set_error(res, 400, std::nullopt, error::InvalidRequest, "Batch bodies are not supported");
        return;
    }

    JsonRpcMessage msg;
    try {
        msg = Codec::parse(req.body);
    } catch (const ParseError& e) {
        logging::logger()->warn("rejecting POST body: {}", e.what());
        set_error(res, 400, std::nullopt, error::ParseError, e.what());
        return;
    }

    std::string session_header = req.get_header_value(header::SessionId);

    if (auto* notif = std::get_if<JsonRpcNotification>(&msg)) {
        if (notif->method == "notifications/cancelled" && !session_header.empty() &&
            notif->params && notif->params->contains("requestId")) {
            RequestId target;
            try {
                from_json(notif->params->at("requestId"), target);
            } catch (const std::exception& e) {
                set_error(res, 400, std::nullopt, error::InvalidParams, e.what());
                return;
            }
            std::string reason = "cancelled by caller";
            auto it = notif->params->find("reason");
            if (it != notif->params->end() && it->is_string()) reason = it->get<std::string>();
            dispatcher_->cancel(session_header, target, reason);
        } else {
            logging::logger()->debug("ignoring notification '{}'", notif->method);
        }
        res.status = 202;
        return;
    }
    if (!std::holds_alternative<JsonRpcRequest>(msg)) {
        set_error(res, 400, std::nullopt, error::InvalidRequest, "Expected a request");
        return;
    }

    InboundCall call;
    call.request = std::get<JsonRpcRequest>(std::move(msg));
    if (!session_header.empty()) call.meta.session_id = session_header;
    call.meta.accept = AcceptSet::from_headers(req.get_header_value("Accept"),
                                               req.get_header_value(header::Resume));

    CallPlan plan;
    try {
        plan = dispatcher_->accept(call);
    } catch (const ProtocolViolation& e) {
        int status = e.code == error::InvalidRequest ? 409 : 400;
        set_error(res, status, call.request.id, e.code, e.what());
        return;
    }
    res.set_header(header::SessionId, plan.session->id());

    if (plan.mode == ResponseMode::Immediate) {
        nlohmann::json body;
        to_json(body, dispatcher_->run_immediate(plan));
        res.set_content(body.dump(), content_type::Json);
        return;
    }

    res.set_header("Cache-Control", "no-cache");
    auto started = std::make_shared<std::atomic<bool>>(false);
    res.set_chunked_content_provider(content_type::EventStream,
        [this, plan, started](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            if (started->exchange(true)) return false;
            HttpEventSink events(sink);
            dispatcher_->run_streamed(plan, events);
            sink.done();
            return true;
        },
        [this, plan, started](bool /*success*/) {
            // The call was accepted; it still has to run to its terminal event.
            if (!started->exchange(true)) {
                ClosedSink closed;
                dispatcher_->run_streamed(plan, closed);
            }
        });
}

void HttpServerTransport::handle_resume(const httplib::Request& req, httplib::Response& res) {
    auto origin = req.get_header_value("Origin");
    if (!origin.empty() && !validate_origin(origin)) {
        set_error(res, 403, std::nullopt, error::InvalidRequest, "Invalid origin");
        return;
    }

    std::string session_id = req.get_header_value(header::SessionId);
    std::string last_event = req.get_header_value(header::LastEventId);
    if (session_id.empty() || last_event.empty()) {
        set_error(res, 400, std::nullopt, error::InvalidRequest,
                  "Resume needs Mcp-Session-Id and Last-Event-ID");
        return;
    }

    std::shared_ptr<ReplayCursor> cursor;
    try {
        LastEventId from = parse_last_event_id(last_event);
        cursor = std::make_shared<ReplayCursor>(
            dispatcher_->resume(session_id, from.call_key, from.sequence));
    } catch (const ParseError& e) {
        set_error(res, 400, std::nullopt, error::ParseError, e.what());
        return;
    } catch (const ResumeUnavailable& e) {
        logging::logger()->info("session {}: resume from '{}' refused: {}", session_id,
                                last_event, e.what());
        set_error(res, 404, std::nullopt, error::ResumeUnavailable, e.what());
        return;
    }

    res.set_header(header::SessionId, session_id);
    res.set_header("Cache-Control", "no-cache");
    auto interval = opts_.keep_alive_interval;
    res.set_chunked_content_provider(content_type::EventStream,
        [this, cursor, interval](size_t /*offset*/, httplib::DataSink& sink) -> bool {
            try {
                while (running_ && !cursor->done()) {
                    auto ev = cursor->next(interval);
                    std::string unit = ev ? EventEncoder::encode(*ev) : EventEncoder::keep_alive();
                    if (!sink.write(unit.data(), unit.size())) return false;
                }
            } catch (const ResumeUnavailable& e) {
                logging::logger()->info("resumed stream ended early: {}", e.what());
                return false;
            }
            sink.done();
            return true;
        });
}

void HttpServerTransport::handle_delete(const httplib::Request& req, httplib::Response& res) {
    std::string session_id = req.get_header_value(header::SessionId);
    if (session_id.empty()) {
        set_error(res, 400, std::nullopt, error::InvalidRequest, "Missing Mcp-Session-Id");
        return;
    }
    if (!dispatcher_->close_session(session_id)) {
        set_error(res, 404, std::nullopt, error::SessionNotFound, "Session not found");
        return;
    }
    logging::logger()->info("session {} closed by client", session_id);
    res.status = 200;
}

void HttpServerTransport::start(CallDispatcher& dispatcher) {
    if (running_.exchange(true)) return;

    dispatcher_ = &dispatcher;
    setup_routes();

    logging::logger()->info("listening on http://{}:{}{}", opts_.host, opts_.port, opts_.path);
    // Blocks until shutdown() stops the listener.
    if (!server_->listen(opts_.host, opts_.port)) {
        // A listen cut short by shutdown() is not an error.
        if (running_.exchange(false)) {
            throw TransportError("Failed to start HTTP server on " + opts_.host + ":" +
                                 std::to_string(opts_.port));
        }
    }
}

void HttpServerTransport::shutdown() {
    if (!running_.exchange(false)) return;
    server_->stop();
}

bool HttpServerTransport::is_connected() const {
    return running_;
}

} // namespace streamrpc
