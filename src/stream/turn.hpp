#pragma once
#include "event.hpp"
#include "stats.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>

namespace kbchat {

enum class TurnStatus { Pending, Streaming, Completed, Failed, Cancelled };

const char* turn_status_name(TurnStatus status);

// Completed, Failed and Cancelled have no outgoing transitions
bool is_terminal(TurnStatus status);

// Client-side state of one request/response exchange.
struct Turn {
    std::string id;
    std::string session_id;
    std::string slot;
    std::string input;
    std::string created_at; // ISO 8601, when the turn was opened
    std::string content;
    std::vector<Source> sources;
    nlohmann::json metadata = nlohmann::json::object();
    std::optional<RoutingInfo> routing_info;
    TurnStatus status = TurnStatus::Pending;
    std::string error;
    TurnStats stats;

    bool terminal() const { return is_terminal(status); }
};

// Recognizes chunk payloads that are protocol plumbing rather than text.
// Empty chunks are always control chunks.
struct ChunkFilter {
    std::vector<std::string> exact = {"\b\b\b"};
    std::vector<std::string> prefixes = {
        "\xF0\x9F\xA4\x96", // U+1F916 robot face
        "\xF0\x9F\x94\x8D"  // U+1F50D magnifying glass
    };

    bool is_control(const std::string& text) const;
};

// Applies decoded events to one Turn.
//
//   Pending --start--> Streaming --end--> Completed
//   Pending|Streaming --error--> Failed
//   Pending|Streaming --cancel--> Cancelled
//
// Events that do not fit the current state are ignored; nothing changes
// once a terminal state is reached.
class TurnStateMachine {
public:
    explicit TurnStateMachine(Turn turn, ChunkFilter filter = {},
                              Clock clock = system_clock(), bool dev = false);

    // Returns true if the turn changed.
    bool apply(const ParsedEvent& event);

    // User stop. Returns true if the turn was not yet terminal.
    bool cancel();

    const Turn& turn() const { return turn_; }
    TurnStatus status() const { return turn_.status; }

    // Chunks swallowed by the control filter so far
    size_t dropped_chunks() const { return dropped_chunks_; }

private:
    void merge_metadata(const nlohmann::json& fields);
    void refresh_stats();
    void count_text(const std::string& text);
    void finalize(TurnStatus status);

    Turn turn_;
    ChunkFilter filter_;
    Clock clock_;
    bool dev_;
    size_t dropped_chunks_ = 0;

    // Running counts over turn_.content, so each chunk is scanned once
    uint64_t characters_ = 0;
    uint64_t words_ = 0;
    bool in_word_ = false;
};

} // namespace kbchat
