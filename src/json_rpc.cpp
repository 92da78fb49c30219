#include "streamrpc/json_rpc.hpp"
#include "streamrpc/version.hpp"

namespace streamrpc {

namespace {

nlohmann::json envelope() {
    return nlohmann::json{{"jsonrpc", std::string(JSONRPC_VERSION)}};
}

void put_optional(nlohmann::json& j, const char* key, const std::optional<nlohmann::json>& v) {
    if (v) j[key] = *v;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const RequestId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) {
        j = *n;
    } else {
        j = std::get<std::string>(id);
    }
}

void from_json(const nlohmann::json& j, RequestId& id) {
    if (j.is_number_integer()) {
        id = j.get<int64_t>();
        return;
    }
    if (j.is_string()) {
        id = j.get<std::string>();
        return;
    }
    throw std::invalid_argument("Call id must be an integer or a string, got " +
                                std::string(j.type_name()));
}

std::string to_key(const RequestId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) return std::to_string(*n);
    return std::get<std::string>(id);
}

void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    put_optional(j, "data", e.data);
}

void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    e.data = j.contains("data") ? std::optional<nlohmann::json>(j.at("data")) : std::nullopt;
}

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = envelope();
    to_json(j["id"], r.id);
    j["method"] = r.method;
    put_optional(j, "params", r.params);
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = envelope();
    to_json(j["id"], r.id);
    if (r.error) {
        to_json(j["error"], *r.error);
    } else {
        // A successful call with nothing to say still answers with null.
        j["result"] = r.result.value_or(nlohmann::json(nullptr));
    }
}

void to_json(nlohmann::json& j, const JsonRpcNotification& n) {
    j = envelope();
    j["method"] = n.method;
    put_optional(j, "params", n.params);
}

void to_json(nlohmann::json& j, const JsonRpcMessage& m) {
    std::visit([&j](const auto& v) { to_json(j, v); }, m);
}

JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

JsonRpcResponse make_error_response(const RequestId& id, int code,
                                    const std::string& message,
                                    std::optional<nlohmann::json> data) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, message, std::move(data)};
    return resp;
}

} // namespace streamrpc
