#pragma once
#include "event.hpp"
#include <string>
#include <string_view>
#include <variant>

namespace streamrpc {

/// Server-Sent Events framing of StreamEvents:
///
///   id: <call-key>/<sequence>
///   event: start|content|error|end
///   data: {"id":<call id>,"seq":<sequence>,"payload":<json>}
///   <blank line>
class EventEncoder {
public:
    [[nodiscard]] static std::string encode(const StreamEvent& event);

    /// Comment unit; decoders skip it.
    [[nodiscard]] static std::string keep_alive();

    /// Value of the SSE id field for an event, as echoed in Last-Event-ID.
    [[nodiscard]] static std::string event_id(const RequestId& call_id, int64_t sequence);
};

struct LastEventId {
    std::string call_key;
    int64_t sequence;
};

/// Split a Last-Event-ID value at its final '/'. Throws ParseError.
[[nodiscard]] LastEventId parse_last_event_id(std::string_view value);

struct NeedMoreData {};

using DecodeResult = std::variant<NeedMoreData, StreamEvent>;

/// Incremental decoder. Bytes may arrive in arbitrary pieces; a partial
/// unit stays buffered until its terminating blank line arrives.
class EventDecoder {
public:
    void feed(std::string_view bytes);

    /// Next complete event, or NeedMoreData. Throws ParseError on a
    /// complete but malformed unit (the unit is consumed).
    [[nodiscard]] DecodeResult decode();

    [[nodiscard]] size_t buffered() const { return buffer_.size() - pos_; }
    void reset();

private:
    void compact();

    std::string buffer_;
    size_t pos_ = 0;
};

} // namespace streamrpc
