#pragma once
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>

namespace streamrpc {

/// Call id as sent by the caller. Null and fractional ids are rejected
/// before a message gets this far.
using RequestId = std::variant<int64_t, std::string>;

void to_json(nlohmann::json& j, const RequestId& id);

/// Throws std::invalid_argument for anything but an integer or a string.
void from_json(const nlohmann::json& j, RequestId& id);

/// Key used to index calls by id. Integer ids and their decimal string
/// spelling share a key.
std::string to_key(const RequestId& id);

struct JsonRpcError {
    int code = 0;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
};

void to_json(nlohmann::json& j, const JsonRpcError& e);
void from_json(const nlohmann::json& j, JsonRpcError& e);

/// A call. `params`, when present, must be an object or an array; the
/// dispatcher enforces that on admission.
struct JsonRpcRequest {
    RequestId id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Outcome of an immediate call. Exactly one of result/error is set.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool ok() const { return !error.has_value(); }

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

/// One-way message; only `notifications/cancelled` has an effect.
struct JsonRpcNotification {
    std::string method;
    std::optional<nlohmann::json> params;

    bool operator==(const JsonRpcNotification& o) const {
        return method == o.method && params == o.params;
    }
};

using JsonRpcMessage = std::variant<JsonRpcRequest, JsonRpcResponse, JsonRpcNotification>;

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void to_json(nlohmann::json& j, const JsonRpcNotification& n);
void to_json(nlohmann::json& j, const JsonRpcMessage& m);

JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result);

JsonRpcResponse make_error_response(const RequestId& id, int code,
                                    const std::string& message,
                                    std::optional<nlohmann::json> data = std::nullopt);

} // namespace streamrpc
