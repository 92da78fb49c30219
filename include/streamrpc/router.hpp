#pragma once
#include "call.hpp"
#include "fragment_source.hpp"
#include "json_rpc.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace streamrpc {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using CallHandler = std::function<HandlerResult(const nlohmann::json& params, CallContext& ctx)>;
using StreamHandler = std::function<std::unique_ptr<FragmentSource>(const nlohmann::json& params,
                                                                    CallContext& ctx)>;

struct MethodHandlers {
    CallHandler call;
    StreamHandler stream;
};

class Router {
public:
    /// Register the single-result handler for a method.
    void on_call(const std::string& method, CallHandler handler);

    /// Register the fragment-producing handler for a method.
    void on_stream(const std::string& method, StreamHandler handler);

    void remove(const std::string& method);

    [[nodiscard]] std::optional<MethodHandlers> find(const std::string& method) const;
    [[nodiscard]] bool has_handler(const std::string& method) const;
    [[nodiscard]] bool has_stream_handler(const std::string& method) const;
    [[nodiscard]] std::vector<std::string> methods() const;

    /// Run a method for a single result. Handler exceptions become errors.
    /// Stream-only methods are drained: string fragments are concatenated,
    /// anything else is collected into an array. Draining stops when the
    /// call is cancelled; the caller decides what a cancelled call returns.
    [[nodiscard]] HandlerResult invoke(const std::string& method,
                                       const nlohmann::json& params,
                                       CallContext& ctx) const;

    /// Open a fragment source for a method. Call-only methods yield their
    /// single result as one fragment. Throws HandlerFailure.
    [[nodiscard]] std::unique_ptr<FragmentSource> open_stream(const std::string& method,
                                                              const nlohmann::json& params,
                                                              CallContext& ctx) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, MethodHandlers> handlers_;
};

} // namespace streamrpc
