#pragma once
#include "json_rpc.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace streamrpc {

enum class EventKind {
    Start,
    Content,
    Error,
    End
};

std::string_view to_string(EventKind kind);

/// Parse a wire event name. Returns nullopt for unknown names.
std::optional<EventKind> event_kind_from_string(std::string_view name);

inline bool is_terminal(EventKind kind) {
    return kind == EventKind::End || kind == EventKind::Error;
}

/// One logical event of a streamed call. Sequence numbers are per
/// (session, call): start is 0, each content adds one, the terminal event
/// comes last.
struct StreamEvent {
    RequestId call_id;
    int64_t sequence = 0;
    EventKind kind = EventKind::Content;
    nlohmann::json payload;

    bool operator==(const StreamEvent& o) const {
        return call_id == o.call_id && sequence == o.sequence &&
               kind == o.kind && payload == o.payload;
    }
};

} // namespace streamrpc
