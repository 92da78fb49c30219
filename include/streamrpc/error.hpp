#pragma once
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

namespace streamrpc {

namespace error {
    constexpr int ParseError        = -32700;
    constexpr int InvalidRequest    = -32600;
    constexpr int MethodNotFound    = -32601;
    constexpr int InvalidParams     = -32602;
    constexpr int InternalError     = -32603;
    constexpr int HandlerFailed     = -32000;
    constexpr int CallTimeout       = -32001;
    constexpr int CallCancelled     = -32002;
    constexpr int SessionNotFound   = -32003;
    constexpr int ResumeUnavailable = -32004;
} // namespace error

class Error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Malformed envelope or wire unit.
class ParseError : public Error {
public:
    using Error::Error;
};

/// Call rejected before execution (duplicate call id, bad params, batch body).
class ProtocolViolation : public Error {
public:
    int code;
    ProtocolViolation(int code, const std::string& msg)
        : Error(msg), code(code) {}
};

/// Typed failure raised by a handler or a fragment source.
class HandlerFailure : public Error {
public:
    int code;
    std::optional<nlohmann::json> data;

    explicit HandlerFailure(const std::string& msg,
                            int code = error::HandlerFailed,
                            std::optional<nlohmann::json> data = std::nullopt)
        : Error(msg), code(code), data(std::move(data)) {}
};

/// Replay state for the requested call no longer exists; the caller must
/// restart the call.
class ResumeUnavailable : public Error {
public:
    using Error::Error;
};

class TimeoutError : public Error {
public:
    using Error::Error;
};

class TransportError : public Error {
public:
    using Error::Error;
};

class ConfigError : public Error {
public:
    using Error::Error;
};

} // namespace streamrpc
