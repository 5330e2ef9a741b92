#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace kbchat {

// One undispatched unit of the response body: an event type plus its data.
struct EventFrame {
    std::string kind;    // "message" when the frame declared no type
    std::string payload; // data lines joined with '\n'
};

constexpr const char* kDefaultFrameKind = "message";

// ── Wire event kinds ────────────────────────────────────────────

namespace event_kinds {
    constexpr const char* Start    = "start";
    constexpr const char* Chunk    = "chunk";
    constexpr const char* Sources  = "sources";
    constexpr const char* Citation = "citation";
    constexpr const char* Metadata = "metadata";
    constexpr const char* End      = "end";
    constexpr const char* Error    = "error";
} // namespace event_kinds

enum class EventKind {
    Start,
    Chunk,
    Sources,
    Citation,
    Metadata,
    RoutingInfo,
    End,
    Error,
    Unknown
};

const char* event_kind_name(EventKind kind);

struct Source {
    std::string title;
    std::string url;
    std::string data_source_type;
    std::optional<double> relevance_score;
};

struct RoutingInfo {
    std::string route;
    double confidence = 0.0;
};

// Decoded event. Only the fields belonging to `kind` are meaningful:
//   Start       turn_id, session_id, fields (remaining start keys)
//   Chunk       text
//   Sources     sources (replaces the list)
//   Citation    sources (appended)
//   Metadata    fields
//   RoutingInfo routing
//   End         fields (final metadata)
//   Error       message
//   Unknown     raw_kind
struct ParsedEvent {
    EventKind kind = EventKind::Unknown;
    std::optional<std::string> turn_id;
    std::optional<std::string> session_id;
    std::string text;
    std::vector<Source> sources;
    nlohmann::json fields = nlohmann::json::object();
    RoutingInfo routing;
    std::string message;
    std::string raw_kind;
};

// Builders for events synthesized on the client side (transport failures)
// and used by tests.
ParsedEvent make_chunk_event(const std::string& text);
ParsedEvent make_error_event(const std::string& message);

} // namespace kbchat
