#pragma once
#include <string_view>

namespace streamrpc {

constexpr std::string_view LIBRARY_VERSION     = "0.1.0";
constexpr std::string_view PROTOCOL_VERSION    = "2025-03-26";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

namespace header {
    constexpr const char* SessionId   = "Mcp-Session-Id";
    constexpr const char* LastEventId = "Last-Event-ID";
    constexpr const char* Resume      = "Mcp-Resume";
} // namespace header

namespace content_type {
    constexpr const char* Json        = "application/json";
    constexpr const char* EventStream = "text/event-stream";
} // namespace content_type

} // namespace streamrpc
