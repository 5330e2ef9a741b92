#include "request.hpp"
#include "util.hpp"

#include <stdexcept>

using json = nlohmann::json;

namespace kbchat {

const char* mode_to_string(StreamMode mode) {
    switch (mode) {
        case StreamMode::Agent: return "agent";
        case StreamMode::Direct: return "direct";
        case StreamMode::KnowledgeBase: return "knowledge-base";
    }
    return "agent";
}

std::optional<StreamMode> mode_from_string(const std::string& name) {
    if (name == "agent") return StreamMode::Agent;
    if (name == "direct") return StreamMode::Direct;
    if (name == "knowledge-base" || name == "kb") return StreamMode::KnowledgeBase;
    return std::nullopt;
}

const char* mode_endpoint(StreamMode mode) {
    switch (mode) {
        case StreamMode::Agent: return "/api/streaming-chat/agent";
        case StreamMode::Direct: return "/api/streaming-chat/direct";
        case StreamMode::KnowledgeBase: return "/api/streaming-chat/knowledge-base";
    }
    return "/api/streaming-chat/agent";
}

json build_request_body(const std::string& message,
                        const std::optional<std::string>& session_id,
                        const ChatOptions& options,
                        const std::vector<HistoryMessage>& history) {
    json body;
    body["message"] = message;
    body["model"] = options.model;

    switch (options.mode) {
        case StreamMode::Agent: {
            body["sessionId"] = session_id ? json(*session_id) : json(nullptr);
            body["temperature"] = options.temperature;
            body["topP"] = options.top_p;
            std::string system_prompt = trim(options.system_prompt);
            if (!system_prompt.empty()) {
                body["systemPrompt"] = system_prompt;
            }
            body["history"] = {
                {"enabled", options.history.enabled},
                {"maxMessages", options.history.max_messages},
                {"contextWeight", options.history.context_weight}
            };

            json conversation = json::array();
            if (options.history.enabled) {
                // Keep only the most recent max_messages entries
                size_t limit = options.history.max_messages;
                size_t first = history.size() > limit ? history.size() - limit : 0;
                for (size_t i = first; i < history.size(); ++i) {
                    conversation.push_back({
                        {"role", history[i].role},
                        {"content", history[i].content},
                        {"timestamp", history[i].timestamp}
                    });
                }
            }
            body["conversationHistory"] = std::move(conversation);
            body["dataSources"] = options.data_sources;
            body["options"] = {{"useEnhancement", options.use_enhancement}};
            break;
        }
        case StreamMode::Direct:
            body["temperature"] = options.temperature;
            body["topP"] = options.top_p;
            body["maxTokens"] = options.max_tokens;
            break;
        case StreamMode::KnowledgeBase:
            // The backend manages knowledge-base sessions itself
            body["sessionId"] = nullptr;
            body["enhancementOptions"] = {
                {"temperature", options.temperature},
                {"topP", options.top_p},
                {"maxTokens", options.max_tokens}
            };
            break;
    }
    return body;
}

StreamRequest build_stream_request(const std::string& base_url,
                                   const std::string& message,
                                   const std::optional<std::string>& session_id,
                                   const ChatOptions& options,
                                   const std::vector<HistoryMessage>& history,
                                   long connect_timeout_seconds) {
    if (base_url.empty()) {
        throw std::invalid_argument("build_stream_request: base_url is empty");
    }
    std::string url = base_url;
    while (!url.empty() && url.back() == '/') url.pop_back();

    StreamRequest req;
    req.url = url + mode_endpoint(options.mode);
    req.body = build_request_body(message, session_id, options, history).dump();
    req.headers = {
        {"Content-Type", "application/json"},
        {"Accept", "text/event-stream"}
    };
    req.connect_timeout_seconds = connect_timeout_seconds;
    return req;
}

} // namespace kbchat
