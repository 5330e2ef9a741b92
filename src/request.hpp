#pragma once
#include "http.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace kbchat {

// Backend streaming endpoints. Each mode has its own request body shape.
enum class StreamMode { Agent, Direct, KnowledgeBase };

const char* mode_to_string(StreamMode mode);

// Accepts "agent", "direct", "knowledge-base" (also "kb")
std::optional<StreamMode> mode_from_string(const std::string& name);

// Path of the streaming endpoint, e.g. "/api/streaming-chat/agent"
const char* mode_endpoint(StreamMode mode);

struct HistoryOptions {
    bool enabled = true;
    uint32_t max_messages = 6;
    std::string context_weight = "balanced";
};

struct ChatOptions {
    StreamMode mode = StreamMode::Agent;
    std::string model = "anthropic.claude-3-sonnet-20240229-v1:0";
    double temperature = 0.7;
    double top_p = 0.9;
    uint32_t max_tokens = 1000;
    std::string system_prompt;
    HistoryOptions history;
    nlohmann::json data_sources = {
        {"websites", nlohmann::json::array()},
        {"pdfs", nlohmann::json::array()},
        {"documents", nlohmann::json::array()}
    };
    bool use_enhancement = true;
};

// One message of prior conversation sent along with agent-mode requests.
struct HistoryMessage {
    std::string role; // "user" or "assistant"
    std::string content;
    std::string timestamp;
};

// JSON body for a streaming request in the given mode.
// session_id is ignored by the knowledge-base mode, which always starts fresh.
nlohmann::json build_request_body(const std::string& message,
                                  const std::optional<std::string>& session_id,
                                  const ChatOptions& options,
                                  const std::vector<HistoryMessage>& history);

// Full POST request (URL, headers, body) against base_url.
// Throws std::invalid_argument if base_url is empty.
StreamRequest build_stream_request(const std::string& base_url,
                                   const std::string& message,
                                   const std::optional<std::string>& session_id,
                                   const ChatOptions& options,
                                   const std::vector<HistoryMessage>& history,
                                   long connect_timeout_seconds);

} // namespace kbchat
