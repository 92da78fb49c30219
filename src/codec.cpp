#include "streamrpc/codec.hpp"
#include "streamrpc/error.hpp"
#include "streamrpc/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <stdexcept>
#include <string>

namespace streamrpc {

namespace {

using simdjson::ondemand::json_type;

nlohmann::json convert(simdjson::ondemand::value val);

// ondemand::value and ondemand::document expose the same scalar getters,
// but a scalar root can only be read off the document itself.
template <typename Node>
nlohmann::json convert_scalar(Node& node, json_type type) {
    switch (type) {
        case json_type::string: {
            std::string_view sv = node.get_string();
            return std::string(sv);
        }
        case json_type::number: {
            int64_t i = 0;
            if (node.get_int64().get(i) == simdjson::SUCCESS) return i;
            uint64_t u = 0;
            if (node.get_uint64().get(u) == simdjson::SUCCESS) return u;
            return node.get_double().value();
        }
        case json_type::boolean:
            return node.get_bool().value();
        default:
            return nullptr;
    }
}

nlohmann::json convert(simdjson::ondemand::value val) {
    json_type type = val.type();
    if (type == json_type::object) {
        nlohmann::json out = nlohmann::json::object();
        for (auto field : val.get_object()) {
            std::string_view key = field.unescaped_key();
            out[std::string(key)] = convert(field.value());
        }
        return out;
    }
    if (type == json_type::array) {
        nlohmann::json out = nlohmann::json::array();
        for (auto elem : val.get_array()) out.push_back(convert(elem.value()));
        return out;
    }
    return convert_scalar(val, type);
}

nlohmann::json convert(simdjson::ondemand::document& doc) {
    json_type type = doc.type();
    if (type == json_type::object || type == json_type::array) {
        return convert(doc.get_value().value());
    }
    return convert_scalar(doc, type);
}

RequestId read_id(const nlohmann::json& j, const char* what) {
    const auto& id = j.at("id");
    if (id.is_null()) {
        throw ParseError(std::string(what) + " id must not be null");
    }
    RequestId out;
    from_json(id, out);
    return out;
}

std::optional<nlohmann::json> read_optional(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end()) return std::nullopt;
    return *it;
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw ParseError("Empty input");
    }

    simdjson::ondemand::parser parser;
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    if (auto err = parser.iterate(padded).get(doc)) {
        throw ParseError(std::string("JSON parse error: ") + simdjson::error_message(err));
    }

    // Ondemand finds most syntax errors only while walking the document;
    // they surface here as simdjson_error.
    try {
        return convert(doc);
    } catch (const std::exception& e) {
        throw ParseError(std::string("JSON conversion error: ") + e.what());
    }
}

JsonRpcMessage Codec::parse_object(const nlohmann::json& j) {
    auto version = j.find("jsonrpc");
    if (version == j.end()) {
        throw ParseError("Missing 'jsonrpc' field");
    }
    if (!version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw ParseError("Invalid jsonrpc version, expected '2.0'");
    }

    auto method = j.find("method");
    if (method != j.end() && !method->is_string()) {
        throw ParseError("'method' must be a string");
    }
    const bool has_id = j.contains("id");

    try {
        if (method != j.end()) {
            if (!has_id) {
                return JsonRpcNotification{method->get<std::string>(), read_optional(j, "params")};
            }
            return JsonRpcRequest{read_id(j, "Request"), method->get<std::string>(),
                                  read_optional(j, "params")};
        }
        if (has_id) {
            JsonRpcResponse resp;
            resp.id = read_id(j, "Response");
            resp.result = read_optional(j, "result");
            if (auto err = read_optional(j, "error")) resp.error = err->get<JsonRpcError>();
            return resp;
        }
    } catch (const ParseError&) {
        throw;
    } catch (const std::exception& e) {
        throw ParseError(std::string("Malformed envelope: ") + e.what());
    }
    throw ParseError("Cannot determine message type: missing both 'id' and 'method'");
}

JsonRpcMessage Codec::parse(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    if (!j.is_object()) {
        throw ParseError("Message must be a JSON object");
    }
    return parse_object(j);
}

std::string Codec::serialize(const JsonRpcMessage& msg) {
    nlohmann::json j;
    to_json(j, msg);
    return j.dump();
}

} // namespace streamrpc
