#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string_view>

namespace streamrpc {

class Codec {
public:
    /// Parse raw JSON bytes into a message.
    /// Throws ParseError on invalid JSON or missing required fields.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Parse arbitrary JSON text. Throws ParseError.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Serialize a message to JSON string.
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

private:
    static JsonRpcMessage parse_object(const nlohmann::json& j);
};

} // namespace streamrpc
