#pragma once

#include "types.hpp"
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace ridge_texture::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();
std::string random_token(size_t length);
int64_t elapsed_ms(std::chrono::steady_clock::time_point since);

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
void write_bytes(const fs::path& path, const std::vector<uint8_t>& data);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);
// Writes to a sibling temp file and renames it over `path`.
void write_text_atomic(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);

// Math utilities
float stddev_of(const std::vector<float>& v);

// String utilities
std::string to_lower(const std::string& s);
std::string trim(const std::string& s);
bool starts_with(const std::string& str, const std::string& prefix);
std::vector<std::string> split(const std::string& str, char delimiter);
// Cuts `s` to at most `max_bytes` without splitting a UTF-8 sequence.
std::string truncate_utf8(const std::string& s, size_t max_bytes);
// Replaces every character outside [A-Za-z0-9.-] with '_'.
std::string sanitize_filename(const std::string& name);

} // namespace ridge_texture::core
