#pragma once
#include <string>
#include <cstdint>

namespace kbchat {

// ISO 8601 timestamp
std::string timestamp_now();

// Unix epoch milliseconds (wall clock)
int64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Generate a simple unique ID (hex). Safe to call from any thread.
std::string generate_id();

// Number of Unicode code points in a UTF-8 string
size_t utf8_length(const std::string& s);

// Number of whitespace-separated words
size_t word_count(const std::string& s);

bool starts_with(const std::string& s, const std::string& prefix);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace kbchat
