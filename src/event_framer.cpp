#include "streamrpc/event_framer.hpp"
#include "streamrpc/codec.hpp"
#include "streamrpc/error.hpp"
#include <charconv>

namespace streamrpc {

namespace {

constexpr size_t kCompactThreshold = 4096;

std::string_view strip_cr(std::string_view line) {
    if (!line.empty() && line.back() == '\r') line.remove_suffix(1);
    return line;
}

} // anonymous namespace

// ---------- EventEncoder ----------

std::string EventEncoder::encode(const StreamEvent& event) {
    nlohmann::json data = nlohmann::json::object();
    to_json(data["id"], event.call_id);
    data["seq"] = event.sequence;
    data["payload"] = event.payload;

    std::string out;
    out.reserve(64);
    out += "id: ";
    out += event_id(event.call_id, event.sequence);
    out += "\nevent: ";
    out += to_string(event.kind);
    out += "\ndata: ";
    // dump() escapes embedded newlines, so the data field is one line.
    out += data.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    out += "\n\n";
    return out;
}

std::string EventEncoder::keep_alive() {
    return ": keep-alive\n\n";
}

std::string EventEncoder::event_id(const RequestId& call_id, int64_t sequence) {
    return to_key(call_id) + "/" + std::to_string(sequence);
}

LastEventId parse_last_event_id(std::string_view value) {
    auto slash = value.rfind('/');
    if (slash == std::string_view::npos || slash + 1 >= value.size()) {
        throw ParseError("Malformed Last-Event-ID: " + std::string(value));
    }
    std::string_view seq_text = value.substr(slash + 1);
    int64_t seq = 0;
    auto [ptr, ec] = std::from_chars(seq_text.data(), seq_text.data() + seq_text.size(), seq);
    if (ec != std::errc() || ptr != seq_text.data() + seq_text.size() || seq < 0) {
        throw ParseError("Malformed Last-Event-ID sequence: " + std::string(seq_text));
    }
    return LastEventId{std::string(value.substr(0, slash)), seq};
}

// ---------- EventDecoder ----------

void EventDecoder::feed(std::string_view bytes) {
    buffer_.append(bytes.data(), bytes.size());
}

void EventDecoder::reset() {
    buffer_.clear();
    pos_ = 0;
}

void EventDecoder::compact() {
    if (pos_ >= kCompactThreshold && pos_ * 2 >= buffer_.size()) {
        buffer_.erase(0, pos_);
        pos_ = 0;
    }
}

DecodeResult EventDecoder::decode() {
    while (true) {
        size_t cur = pos_;
        std::string event_name;
        std::string data;
        bool has_data = false;
        bool has_fields = false;

        bool complete = false;
        while (!complete) {
            size_t nl = buffer_.find('\n', cur);
            if (nl == std::string::npos) {
                // Unit not terminated yet; keep everything buffered.
                return NeedMoreData{};
            }
            std::string_view line = strip_cr(std::string_view(buffer_).substr(cur, nl - cur));
            cur = nl + 1;

            if (line.empty()) {
                if (has_fields) {
                    complete = true;
                } else {
                    pos_ = cur;
                }
                continue;
            }
            has_fields = true;
            if (line.front() == ':') continue;

            std::string_view field = line;
            std::string_view value;
            auto colon = line.find(':');
            if (colon != std::string_view::npos) {
                field = line.substr(0, colon);
                value = line.substr(colon + 1);
                if (!value.empty() && value.front() == ' ') value.remove_prefix(1);
            }

            if (field == "event") {
                event_name.assign(value.data(), value.size());
            } else if (field == "data") {
                if (has_data) data += '\n';
                data.append(value.data(), value.size());
                has_data = true;
            }
            // "id", "retry" and unknown fields carry nothing the event
            // itself does not repeat in its data.
        }

        pos_ = cur;
        compact();

        if (!has_data && event_name.empty()) {
            continue; // comment-only unit
        }

        auto kind = event_kind_from_string(event_name);
        if (!kind) {
            throw ParseError("Unknown event kind: '" + event_name + "'");
        }
        if (!has_data) {
            throw ParseError("Event without data field");
        }

        nlohmann::json j = Codec::parse_json(data);
        if (!j.is_object() || !j.contains("id") || !j.contains("seq")) {
            throw ParseError("Event data must be an object with 'id' and 'seq'");
        }

        StreamEvent ev;
        ev.kind = *kind;
        try {
            from_json(j.at("id"), ev.call_id);
            ev.sequence = j.at("seq").get<int64_t>();
        } catch (const std::exception& e) {
            throw ParseError(std::string("Malformed event data: ") + e.what());
        }
        ev.payload = j.contains("payload") ? j.at("payload") : nlohmann::json(nullptr);
        return ev;
    }
}

} // namespace streamrpc
