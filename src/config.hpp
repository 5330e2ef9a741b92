#pragma once
#include "request.hpp"
#include "stream/session.hpp"
#include <string>
#include <vector>
#include <cstdint>
#include <functional>
#include <nlohmann/json.hpp>

namespace kbchat {

struct StreamConfig {
    uint32_t idle_timeout_ms = 30000;
    uint32_t poll_interval_ms = 100;
    uint32_t connect_timeout_seconds = 30;
    uint32_t max_history_turns = 50;
    std::vector<std::string> control_chunks = ChunkFilter{}.exact;
    std::vector<std::string> control_prefixes = ChunkFilter{}.prefixes;
};

struct Config {
    std::string base_url = "http://localhost:3002";
    bool dev = false;      // Logs ignored stream events and error bodies

    ChatOptions chat;
    StreamConfig stream;

    // Load from ~/.kbchat/config.json + env vars
    static Config load();

    // Load from an explicit path + env vars. A missing file is created with
    // defaults; a malformed one is left alone and defaults are used.
    static Config load(const std::string& path);

    // Default config JSON (used by load() and tests)
    static nlohmann::json defaults_json();

    // Parse a config document. Keys of the wrong type keep their defaults.
    // Throws std::invalid_argument for an unknown chat mode.
    static Config from_json(const nlohmann::json& j);

    ChunkFilter chunk_filter() const;
    SessionOptions session_options() const;

    // Persist chat mode + model selection to the config file
    bool persist_selection() const;
};

std::string default_config_path();

// Read-modify-write the config file atomically.
// The callback receives a mutable reference to the parsed JSON.
bool modify_config_json(const std::string& path,
                        const std::function<void(nlohmann::json&)>& modifier);

} // namespace kbchat
