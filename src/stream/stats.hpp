#pragma once
#include <nlohmann/json.hpp>
#include <string>
#include <functional>
#include <cstdint>

namespace kbchat {

// Milliseconds since the epoch. Injectable so tests control time.
using Clock = std::function<int64_t()>;

Clock system_clock();

struct TurnStats {
    int64_t started_at_ms = 0;
    int64_t elapsed_ms = 0;
    uint64_t characters_received = 0; // Unicode code points
    uint64_t words_received = 0;
    int64_t words_per_second = 0;
    int64_t characters_per_second = 0;
    uint64_t tokens_used = 0;         // as reported by the backend, never estimated
    double efficiency = 0.0;          // characters per token, 2 decimals
    bool finalized = false;
};

// round(count / elapsed_ms * 1000); 0 when elapsed_ms <= 0
int64_t per_second(uint64_t count, int64_t elapsed_ms);

TurnStats compute_stats(const std::string& content, int64_t started_at_ms,
                        int64_t now_ms, uint64_t tokens_used);

// Same, from character and word counts kept while content accumulates
TurnStats compute_stats(uint64_t characters, uint64_t words, int64_t started_at_ms,
                        int64_t now_ms, uint64_t tokens_used);

// "tokensUsed" from backend metadata, 0 when absent or not a number
uint64_t reported_tokens(const nlohmann::json& metadata);

// "1234ms | 56 chars | 7 WPS | 150 tokens" (tokens omitted when 0)
std::string format_stats(const TurnStats& stats);

} // namespace kbchat
