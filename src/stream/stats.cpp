#include "stats.hpp"
#include "../util.hpp"

#include <cmath>

namespace kbchat {

Clock system_clock() {
    return [] { return epoch_millis(); };
}

int64_t per_second(uint64_t count, int64_t elapsed_ms) {
    if (elapsed_ms <= 0) return 0;
    return std::llround(static_cast<double>(count) / static_cast<double>(elapsed_ms) * 1000.0);
}

TurnStats compute_stats(const std::string& content, int64_t started_at_ms,
                        int64_t now_ms, uint64_t tokens_used) {
    return compute_stats(utf8_length(content), word_count(content), started_at_ms, now_ms,
                         tokens_used);
}

TurnStats compute_stats(uint64_t characters, uint64_t words, int64_t started_at_ms,
                        int64_t now_ms, uint64_t tokens_used) {
    TurnStats stats;
    stats.started_at_ms = started_at_ms;
    stats.elapsed_ms = now_ms > started_at_ms ? now_ms - started_at_ms : 0;
    stats.characters_received = characters;
    stats.words_received = words;
    stats.words_per_second = per_second(stats.words_received, stats.elapsed_ms);
    stats.characters_per_second = per_second(stats.characters_received, stats.elapsed_ms);
    stats.tokens_used = tokens_used;
    if (tokens_used > 0) {
        double ratio = static_cast<double>(stats.characters_received) /
                       static_cast<double>(tokens_used);
        stats.efficiency = std::round(ratio * 100.0) / 100.0;
    }
    return stats;
}

uint64_t reported_tokens(const nlohmann::json& metadata) {
    if (!metadata.is_object()) return 0;
    auto it = metadata.find("tokensUsed");
    if (it == metadata.end()) return 0;
    if (it->is_number_unsigned()) return it->get<uint64_t>();
    if (it->is_number_integer()) {
        auto v = it->get<int64_t>();
        return v > 0 ? static_cast<uint64_t>(v) : 0;
    }
    if (it->is_number_float()) {
        auto v = it->get<double>();
        return v > 0 ? static_cast<uint64_t>(std::llround(v)) : 0;
    }
    return 0;
}

std::string format_stats(const TurnStats& stats) {
    std::string out = std::to_string(stats.elapsed_ms) + "ms | " +
                      std::to_string(stats.characters_received) + " chars | " +
                      std::to_string(stats.words_per_second) + " WPS";
    if (stats.tokens_used > 0) {
        out += " | " + std::to_string(stats.tokens_used) + " tokens";
    }
    return out;
}

} // namespace kbchat
