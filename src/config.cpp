#include "config.hpp"
#include "util.hpp"

#include <cstdlib>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <nlohmann/json.hpp>

namespace kbchat {

std::string default_config_path() {
    return expand_home("~/.kbchat/config.json");
}

nlohmann::json Config::defaults_json() {
    ChatOptions chat;
    StreamConfig stream;
    return {
        {"base_url", "http://localhost:3002"},
        {"dev", false},
        {"chat", {
            {"mode", mode_to_string(chat.mode)},
            {"model", chat.model},
            {"temperature", chat.temperature},
            {"top_p", chat.top_p},
            {"max_tokens", chat.max_tokens},
            {"system_prompt", ""},
            {"history_enabled", chat.history.enabled},
            {"history_max_messages", chat.history.max_messages},
            {"context_weight", chat.history.context_weight},
            {"use_enhancement", chat.use_enhancement}
        }},
        {"stream", {
            {"idle_timeout_ms", stream.idle_timeout_ms},
            {"poll_interval_ms", stream.poll_interval_ms},
            {"connect_timeout_seconds", stream.connect_timeout_seconds},
            {"max_history_turns", stream.max_history_turns},
            {"control_chunks", stream.control_chunks},
            {"control_prefixes", stream.control_prefixes}
        }}
    };
}

static nlohmann::json merge_defaults(const nlohmann::json& existing,
                                      const nlohmann::json& defaults) {
    nlohmann::json merged = existing;
    for (auto& [key, value] : defaults.items()) {
        if (!merged.contains(key)) {
            merged[key] = value;
        } else if (value.is_object() && merged[key].is_object()) {
            merged[key] = merge_defaults(merged[key], value);
        }
    }
    return merged;
}

static std::vector<std::string> string_list(const nlohmann::json& arr) {
    std::vector<std::string> out;
    for (const auto& item : arr) {
        if (item.is_string()) out.push_back(item.get<std::string>());
    }
    return out;
}

Config Config::from_json(const nlohmann::json& j) {
    Config cfg;
    if (!j.is_object()) return cfg;

    if (j.contains("base_url") && j["base_url"].is_string())
        cfg.base_url = j["base_url"].get<std::string>();
    if (j.contains("dev") && j["dev"].is_boolean())
        cfg.dev = j["dev"].get<bool>();

    if (j.contains("chat") && j["chat"].is_object()) {
        auto& c = j["chat"];
        if (c.contains("mode") && c["mode"].is_string()) {
            auto name = c["mode"].get<std::string>();
            auto mode = mode_from_string(name);
            if (!mode) throw std::invalid_argument("Unknown chat mode: " + name);
            cfg.chat.mode = *mode;
        }
        if (c.contains("model") && c["model"].is_string())
            cfg.chat.model = c["model"].get<std::string>();
        if (c.contains("temperature") && c["temperature"].is_number())
            cfg.chat.temperature = c["temperature"].get<double>();
        if (c.contains("top_p") && c["top_p"].is_number())
            cfg.chat.top_p = c["top_p"].get<double>();
        if (c.contains("max_tokens") && c["max_tokens"].is_number_unsigned())
            cfg.chat.max_tokens = c["max_tokens"].get<uint32_t>();
        if (c.contains("system_prompt") && c["system_prompt"].is_string())
            cfg.chat.system_prompt = c["system_prompt"].get<std::string>();
        if (c.contains("history_enabled") && c["history_enabled"].is_boolean())
            cfg.chat.history.enabled = c["history_enabled"].get<bool>();
        if (c.contains("history_max_messages") && c["history_max_messages"].is_number_unsigned())
            cfg.chat.history.max_messages = c["history_max_messages"].get<uint32_t>();
        if (c.contains("context_weight") && c["context_weight"].is_string())
            cfg.chat.history.context_weight = c["context_weight"].get<std::string>();
        if (c.contains("use_enhancement") && c["use_enhancement"].is_boolean())
            cfg.chat.use_enhancement = c["use_enhancement"].get<bool>();
    }

    if (j.contains("stream") && j["stream"].is_object()) {
        auto& s = j["stream"];
        if (s.contains("idle_timeout_ms") && s["idle_timeout_ms"].is_number_unsigned())
            cfg.stream.idle_timeout_ms = s["idle_timeout_ms"].get<uint32_t>();
        if (s.contains("poll_interval_ms") && s["poll_interval_ms"].is_number_unsigned())
            cfg.stream.poll_interval_ms = s["poll_interval_ms"].get<uint32_t>();
        if (s.contains("connect_timeout_seconds") && s["connect_timeout_seconds"].is_number_unsigned())
            cfg.stream.connect_timeout_seconds = s["connect_timeout_seconds"].get<uint32_t>();
        if (s.contains("max_history_turns") && s["max_history_turns"].is_number_unsigned())
            cfg.stream.max_history_turns = s["max_history_turns"].get<uint32_t>();
        if (s.contains("control_chunks") && s["control_chunks"].is_array())
            cfg.stream.control_chunks = string_list(s["control_chunks"]);
        if (s.contains("control_prefixes") && s["control_prefixes"].is_array())
            cfg.stream.control_prefixes = string_list(s["control_prefixes"]);
    }

    return cfg;
}

Config Config::load() {
    return load(default_config_path());
}

Config Config::load(const std::string& config_path) {
    nlohmann::json j;

    std::ifstream file(config_path);
    if (file.is_open()) {
        try {
            nlohmann::json original = nlohmann::json::parse(file);
            file.close();
            j = merge_defaults(original, defaults_json());
            if (j != original) {
                atomic_write_file(config_path, j.dump(4) + "\n");
                std::cerr << "[config] Migrated config with new defaults: "
                          << config_path << "\n";
            }
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Ignoring malformed config " << config_path
                      << ": " << e.what() << "\n";
            j = defaults_json();
        }
    } else {
        j = defaults_json();
        if (atomic_write_file(config_path, j.dump(4) + "\n"))
            std::cerr << "[config] Created default config: " << config_path << "\n";
    }

    Config cfg = from_json(j);

    // Environment variables always override config file
    if (const char* v = std::getenv("KBCHAT_BASE_URL"))
        cfg.base_url = v;
    if (const char* v = std::getenv("KBCHAT_MODEL"))
        cfg.chat.model = v;
    if (const char* v = std::getenv("KBCHAT_MODE")) {
        auto mode = mode_from_string(v);
        if (!mode) throw std::invalid_argument(std::string("Unknown chat mode: ") + v);
        cfg.chat.mode = *mode;
    }
    if (const char* v = std::getenv("KBCHAT_IDLE_TIMEOUT_MS")) {
        try {
            cfg.stream.idle_timeout_ms = static_cast<uint32_t>(std::stoul(v));
        } catch (const std::exception&) {
            std::cerr << "[config] Ignoring invalid KBCHAT_IDLE_TIMEOUT_MS: " << v << "\n";
        }
    }

    return cfg;
}

ChunkFilter Config::chunk_filter() const {
    ChunkFilter filter;
    filter.exact = stream.control_chunks;
    filter.prefixes = stream.control_prefixes;
    return filter;
}

SessionOptions Config::session_options() const {
    SessionOptions opts;
    opts.base_url = base_url;
    opts.idle_timeout = std::chrono::milliseconds(stream.idle_timeout_ms);
    opts.poll_interval = std::chrono::milliseconds(
        stream.poll_interval_ms > 0 ? stream.poll_interval_ms : 1);
    opts.connect_timeout_seconds = stream.connect_timeout_seconds;
    opts.chunk_filter = chunk_filter();
    opts.max_history_turns = stream.max_history_turns;
    opts.dev = dev;
    return opts;
}

bool modify_config_json(const std::string& path,
                        const std::function<void(nlohmann::json&)>& modifier) {
    nlohmann::json j = nlohmann::json::object();
    std::ifstream file(path);
    if (file.is_open()) {
        try {
            j = nlohmann::json::parse(file);
        } catch (const nlohmann::json::exception& e) {
            std::cerr << "[config] Cannot update malformed config " << path
                      << ": " << e.what() << "\n";
            return false;
        }
    }
    if (!j.is_object()) j = nlohmann::json::object();
    modifier(j);
    return atomic_write_file(path, j.dump(4) + "\n");
}

bool Config::persist_selection() const {
    return modify_config_json(default_config_path(), [this](nlohmann::json& j) {
        if (!j.contains("chat") || !j["chat"].is_object()) j["chat"] = nlohmann::json::object();
        j["chat"]["mode"] = mode_to_string(chat.mode);
        j["chat"]["model"] = chat.model;
    });
}

} // namespace kbchat
