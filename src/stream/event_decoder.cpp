#include "event_decoder.hpp"
#include "../util.hpp"

#include <iostream>
#include <stdexcept>

using json = nlohmann::json;

namespace kbchat {

const char* event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::Start: return "start";
        case EventKind::Chunk: return "chunk";
        case EventKind::Sources: return "sources";
        case EventKind::Citation: return "citation";
        case EventKind::Metadata: return "metadata";
        case EventKind::RoutingInfo: return "routing";
        case EventKind::End: return "end";
        case EventKind::Error: return "error";
        case EventKind::Unknown: return "unknown";
    }
    return "unknown";
}

ParsedEvent make_chunk_event(const std::string& text) {
    ParsedEvent ev;
    ev.kind = EventKind::Chunk;
    ev.text = text;
    return ev;
}

ParsedEvent make_error_event(const std::string& message) {
    ParsedEvent ev;
    ev.kind = EventKind::Error;
    ev.message = message;
    return ev;
}

namespace {

// Thrown for payloads that parse as JSON but have the wrong shape.
struct PayloadError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

std::optional<std::string> string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::nullopt;
    if (it->is_string()) return it->get<std::string>();
    if (it->is_number()) return it->dump();
    return std::nullopt;
}

Source parse_source(const json& j) {
    if (!j.is_object()) throw PayloadError("source is not an object");
    Source s;
    s.title = string_field(j, "title").value_or("");
    s.url = string_field(j, "url").value_or(string_field(j, "uri").value_or(""));
    s.data_source_type = string_field(j, "dataSourceType").value_or(
        string_field(j, "type").value_or(""));
    auto score = j.find("relevanceScore");
    if (score != j.end() && score->is_number()) {
        s.relevance_score = score->get<double>();
    }
    return s;
}

std::vector<Source> parse_source_list(const json& j) {
    if (!j.is_array()) throw PayloadError("sources is not an array");
    std::vector<Source> out;
    out.reserve(j.size());
    for (const auto& item : j) {
        out.push_back(parse_source(item));
    }
    return out;
}

json parse_payload(const std::string& payload) {
    if (trim(payload).empty()) return json::object();
    json j = json::parse(payload);
    if (!j.is_object()) throw PayloadError("payload is not a JSON object");
    return j;
}

void decode_known(const EventFrame& frame, std::vector<ParsedEvent>& out) {
    json j = parse_payload(frame.payload);
    ParsedEvent ev;

    if (frame.kind == event_kinds::Start) {
        ev.kind = EventKind::Start;
        ev.turn_id = string_field(j, "turnId");
        ev.session_id = string_field(j, "sessionId");
        j.erase("turnId");
        j.erase("sessionId");
        ev.fields = std::move(j);
    } else if (frame.kind == event_kinds::Chunk) {
        ev.kind = EventKind::Chunk;
        auto it = j.find("content");
        if (it == j.end()) it = j.find("text");
        if (it != j.end() && !it->is_null()) {
            if (!it->is_string()) throw PayloadError("chunk content is not a string");
            ev.text = it->get<std::string>();
        }
    } else if (frame.kind == event_kinds::Sources) {
        ev.kind = EventKind::Sources;
        auto it = j.find("sources");
        if (it != j.end() && !it->is_null()) {
            ev.sources = parse_source_list(*it);
        }
    } else if (frame.kind == event_kinds::Citation) {
        ev.kind = EventKind::Citation;
        auto it = j.find("source");
        if (it != j.end() && it->is_array()) {
            ev.sources = parse_source_list(*it);
        } else if (it != j.end() && !it->is_null()) {
            ev.sources.push_back(parse_source(*it));
        } else if ((it = j.find("sources")) != j.end() && !it->is_null()) {
            ev.sources = parse_source_list(*it);
        } else {
            throw PayloadError("citation without source");
        }
    } else if (frame.kind == event_kinds::Metadata) {
        ev.kind = EventKind::Metadata;
        std::optional<ParsedEvent> routing;
        auto it = j.find("routingAnalysis");
        if (it != j.end() && it->is_object()) {
            ParsedEvent r;
            r.kind = EventKind::RoutingInfo;
            r.routing.route = string_field(*it, "route").value_or("");
            auto conf = it->find("confidence");
            if (conf != it->end() && conf->is_number()) {
                r.routing.confidence = conf->get<double>();
            }
            routing = std::move(r);
        }
        ev.fields = std::move(j);
        out.push_back(std::move(ev));
        if (routing) out.push_back(std::move(*routing));
        return;
    } else if (frame.kind == event_kinds::End) {
        ev.kind = EventKind::End;
        ev.fields = std::move(j);
    } else {
        ev.kind = EventKind::Error;
        ev.message = string_field(j, "error").value_or(
            string_field(j, "message").value_or(""));
        if (ev.message.empty()) ev.message = "Streaming error";
    }
    out.push_back(std::move(ev));
}

bool is_known_kind(const std::string& kind) {
    return kind == event_kinds::Start || kind == event_kinds::Chunk ||
           kind == event_kinds::Sources || kind == event_kinds::Citation ||
           kind == event_kinds::Metadata || kind == event_kinds::End ||
           kind == event_kinds::Error;
}

} // namespace

std::vector<ParsedEvent> decode_frame(const EventFrame& frame) {
    std::vector<ParsedEvent> events;

    if (!is_known_kind(frame.kind)) {
        ParsedEvent ev;
        ev.kind = EventKind::Unknown;
        ev.raw_kind = frame.kind;
        events.push_back(std::move(ev));
        return events;
    }

    try {
        decode_known(frame, events);
    } catch (const json::exception& e) {
        std::cerr << "[decoder] Failed to parse '" << frame.kind << "' payload: "
                  << e.what() << "\n";
        events.clear();
    } catch (const PayloadError& e) {
        std::cerr << "[decoder] Skipping malformed '" << frame.kind << "' frame: "
                  << e.what() << "\n";
        events.clear();
    }
    return events;
}

} // namespace kbchat
