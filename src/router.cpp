#include "streamrpc/router.hpp"
#include "streamrpc/error.hpp"

namespace streamrpc {

namespace {

// Unhooks the call from a source before the source is destroyed.
class CancelHookGuard {
public:
    CancelHookGuard(CallContext& ctx, FragmentSource& source) : ctx_(ctx) {
        FragmentSource* raw = &source;
        ctx_.on_cancel([raw] { raw->cancel(); });
    }
    ~CancelHookGuard() { ctx_.clear_on_cancel(); }

    CancelHookGuard(const CancelHookGuard&) = delete;
    CancelHookGuard& operator=(const CancelHookGuard&) = delete;

private:
    CallContext& ctx_;
};

} // anonymous namespace

void Router::on_call(const std::string& method, CallHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[method].call = std::move(handler);
}

void Router::on_stream(const std::string& method, StreamHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_[method].stream = std::move(handler);
}

void Router::remove(const std::string& method) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(method);
}

std::optional<MethodHandlers> Router::find(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(method);
    if (it == handlers_.end()) return std::nullopt;
    return it->second;
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.count(method) > 0;
}

bool Router::has_stream_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = handlers_.find(method);
    return it != handlers_.end() && static_cast<bool>(it->second.stream);
}

std::vector<std::string> Router::methods() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, h] : handlers_) names.push_back(name);
    return names;
}

HandlerResult Router::invoke(const std::string& method,
                             const nlohmann::json& params,
                             CallContext& ctx) const {
    // Handlers run without the lock held so they may register methods.
    auto handlers = find(method);
    if (!handlers) {
        return JsonRpcError{error::MethodNotFound, "Method not found: " + method, std::nullopt};
    }

    try {
        if (handlers->call) {
            return handlers->call(params, ctx);
        }

        auto source = handlers->stream(params, ctx);
        if (!source) {
            return JsonRpcError{error::HandlerFailed, "Handler produced no source", std::nullopt};
        }
        std::vector<nlohmann::json> fragments;
        bool all_strings = true;
        {
            // A cancel wakes a blocked next() through the source itself.
            CancelHookGuard hook(ctx, *source);
            while (!ctx.cancelled()) {
                auto fragment = source->next();
                if (!fragment || ctx.cancelled()) break;
                all_strings = all_strings && fragment->is_string();
                fragments.push_back(std::move(*fragment));
            }
        }
        if (all_strings && !fragments.empty()) {
            std::string joined;
            for (const auto& f : fragments) joined += f.get<std::string>();
            return nlohmann::json(joined);
        }
        return nlohmann::json(fragments);
    } catch (const HandlerFailure& e) {
        return JsonRpcError{e.code, e.what(), e.data};
    } catch (const std::exception& e) {
        return JsonRpcError{error::HandlerFailed, e.what(), std::nullopt};
    }
}

std::unique_ptr<FragmentSource> Router::open_stream(const std::string& method,
                                                    const nlohmann::json& params,
                                                    CallContext& ctx) const {
    auto handlers = find(method);
    if (!handlers) {
        throw HandlerFailure("Method not found: " + method, error::MethodNotFound);
    }

    if (handlers->stream) {
        auto source = handlers->stream(params, ctx);
        if (!source) throw HandlerFailure("Handler produced no source");
        return source;
    }

    HandlerResult result = handlers->call(params, ctx);
    if (auto* err = std::get_if<JsonRpcError>(&result)) {
        throw HandlerFailure(err->message, err->code, err->data);
    }
    std::vector<nlohmann::json> single;
    single.push_back(std::move(std::get<nlohmann::json>(result)));
    return std::make_unique<VectorSource>(std::move(single));
}

} // namespace streamrpc
