#include "streamrpc/negotiator.hpp"
#include <algorithm>
#include <cctype>

namespace streamrpc {

namespace {

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

} // anonymous namespace

std::string_view to_string(ResponseMode mode) {
    return mode == ResponseMode::Streamed ? "streamed" : "immediate";
}

AcceptSet AcceptSet::from_headers(const std::string& accept, const std::string& resume_header) {
    std::string value = lowercase(accept);
    AcceptSet set;
    set.streaming = value.find("text/event-stream") != std::string::npos ||
                    value.find("*/*") != std::string::npos ||
                    value.find("text/*") != std::string::npos;
    std::string resume = lowercase(resume_header);
    set.resume = set.streaming && resume != "off" && resume != "false" && resume != "0";
    return set;
}

ResponseMode decide(const NegotiationPolicy& policy,
                    const Capabilities& negotiated,
                    const JsonRpcRequest& call,
                    const AcceptSet& declared) {
    if (!negotiated.streaming) return ResponseMode::Immediate;
    if (!declared.streaming) return ResponseMode::Immediate;

    if (policy.immediate_methods.count(call.method)) return ResponseMode::Immediate;
    if (policy.streamed_methods.count(call.method)) return ResponseMode::Streamed;

    size_t size = call.params ? call.params->dump().size() : 0;
    return size >= policy.stream_threshold_bytes ? ResponseMode::Streamed
                                                 : ResponseMode::Immediate;
}

} // namespace streamrpc
