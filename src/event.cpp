#include "streamrpc/event.hpp"

namespace streamrpc {

std::string_view to_string(EventKind kind) {
    switch (kind) {
        case EventKind::Start:   return "start";
        case EventKind::Content: return "content";
        case EventKind::Error:   return "error";
        case EventKind::End:     return "end";
    }
    return "content";
}

std::optional<EventKind> event_kind_from_string(std::string_view name) {
    if (name == "start") return EventKind::Start;
    if (name == "content") return EventKind::Content;
    if (name == "error") return EventKind::Error;
    if (name == "end") return EventKind::End;
    return std::nullopt;
}

} // namespace streamrpc
