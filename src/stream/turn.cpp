#include "turn.hpp"
#include "../util.hpp"

#include <iostream>
#include <cctype>

namespace kbchat {

const char* turn_status_name(TurnStatus status) {
    switch (status) {
        case TurnStatus::Pending: return "pending";
        case TurnStatus::Streaming: return "streaming";
        case TurnStatus::Completed: return "completed";
        case TurnStatus::Failed: return "failed";
        case TurnStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

bool is_terminal(TurnStatus status) {
    return status == TurnStatus::Completed || status == TurnStatus::Failed ||
           status == TurnStatus::Cancelled;
}

bool ChunkFilter::is_control(const std::string& text) const {
    if (text.empty()) return true;
    for (const auto& e : exact) {
        if (text == e) return true;
    }
    for (const auto& p : prefixes) {
        if (!p.empty() && starts_with(text, p)) return true;
    }
    return false;
}

TurnStateMachine::TurnStateMachine(Turn turn, ChunkFilter filter, Clock clock, bool dev)
    : turn_(std::move(turn)), filter_(std::move(filter)),
      clock_(clock ? std::move(clock) : system_clock()), dev_(dev) {
    if (turn_.stats.started_at_ms == 0) {
        turn_.stats.started_at_ms = clock_();
    }
    count_text(turn_.content);
}

void TurnStateMachine::merge_metadata(const nlohmann::json& fields) {
    if (!fields.is_object()) return;
    for (auto& [key, value] : fields.items()) {
        turn_.metadata[key] = value;
    }
}

void TurnStateMachine::count_text(const std::string& text) {
    characters_ += utf8_length(text);
    for (char c : text) {
        if (std::isspace(static_cast<unsigned char>(c))) {
            in_word_ = false;
        } else if (!in_word_) {
            in_word_ = true;
            ++words_;
        }
    }
}

void TurnStateMachine::refresh_stats() {
    turn_.stats = compute_stats(characters_, words_, turn_.stats.started_at_ms, clock_(),
                                reported_tokens(turn_.metadata));
}

void TurnStateMachine::finalize(TurnStatus status) {
    refresh_stats();
    turn_.stats.finalized = true;
    turn_.status = status;
}

bool TurnStateMachine::apply(const ParsedEvent& event) {
    if (turn_.terminal()) return false;

    const bool streaming = turn_.status == TurnStatus::Streaming;

    switch (event.kind) {
        case EventKind::Start:
            if (turn_.status != TurnStatus::Pending) return false; // duplicate start
            turn_.status = TurnStatus::Streaming;
            if (event.turn_id && !event.turn_id->empty()) turn_.id = *event.turn_id;
            if (event.session_id && !event.session_id->empty())
                turn_.session_id = *event.session_id;
            merge_metadata(event.fields);
            refresh_stats();
            return true;

        case EventKind::Chunk:
            if (!streaming) return false;
            if (filter_.is_control(event.text)) {
                ++dropped_chunks_;
                return false;
            }
            turn_.content += event.text;
            count_text(event.text);
            refresh_stats();
            return true;

        case EventKind::Sources:
            if (!streaming) return false;
            turn_.sources = event.sources;
            return true;

        case EventKind::Citation: {
            if (!streaming) return false;
            bool changed = false;
            for (const auto& src : event.sources) {
                bool duplicate = false;
                if (!src.url.empty()) {
                    for (const auto& have : turn_.sources) {
                        if (have.url == src.url) { duplicate = true; break; }
                    }
                }
                if (duplicate) continue;
                turn_.sources.push_back(src);
                changed = true;
            }
            return changed;
        }

        case EventKind::Metadata:
            if (!streaming || event.fields.empty()) return false;
            merge_metadata(event.fields);
            refresh_stats();
            return true;

        case EventKind::RoutingInfo:
            if (!streaming || turn_.routing_info) return false;
            turn_.routing_info = event.routing;
            return true;

        case EventKind::End:
            if (!streaming) return false;
            merge_metadata(event.fields);
            finalize(TurnStatus::Completed);
            return true;

        case EventKind::Error:
            turn_.error = event.message.empty() ? "Streaming error" : event.message;
            finalize(TurnStatus::Failed);
            return true;

        case EventKind::Unknown:
            if (dev_) {
                std::cerr << "[turn] Ignoring unknown event kind '" << event.raw_kind
                          << "' in turn " << turn_.id << "\n";
            }
            return false;
    }
    return false;
}

bool TurnStateMachine::cancel() {
    if (turn_.terminal()) return false;
    finalize(TurnStatus::Cancelled);
    return true;
}

} // namespace kbchat
