#pragma once
#include "json_rpc.hpp"
#include "session.hpp"
#include <set>
#include <string>
#include <string_view>

namespace streamrpc {

enum class ResponseMode {
    Immediate,
    Streamed
};

std::string_view to_string(ResponseMode mode);

/// What the caller declared it can consume for one call.
struct AcceptSet {
    bool streaming = false;
    bool resume = false;

    /// Parse an HTTP Accept header value. `text/event-stream` (or a
    /// wildcard) declares streaming; resume follows streaming unless
    /// `resume_header` is "off", "false" or "0".
    static AcceptSet from_headers(const std::string& accept,
                                  const std::string& resume_header = "");

    Capabilities to_capabilities() const { return {streaming, streaming && resume}; }
};

struct NegotiationPolicy {
    size_t stream_threshold_bytes = 256;
    std::set<std::string> streamed_methods;
    std::set<std::string> immediate_methods;
};

/// Pure response-mode decision:
///  1. no negotiated streaming          -> Immediate
///  2. this call does not accept events -> Immediate
///  3. method lists, then params size against the threshold.
[[nodiscard]] ResponseMode decide(const NegotiationPolicy& policy,
                                  const Capabilities& negotiated,
                                  const JsonRpcRequest& call,
                                  const AcceptSet& declared);

} // namespace streamrpc
