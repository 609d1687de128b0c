#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace tile_develop::core {

namespace fs = std::filesystem;

// Time utilities
std::string get_iso_timestamp();
std::string get_run_id();

// File utilities
std::vector<uint8_t> read_bytes(const fs::path& path);
std::string read_text(const fs::path& path);
void write_text(const fs::path& path, const std::string& text);

// Hash utilities
std::string sha256_bytes(const std::vector<uint8_t>& data);
std::string sha256_string(const std::string& data);

// String utilities
std::string to_lower(const std::string& s);
std::string format_bytes(uint64_t bytes);

// Top-level guard for command entry points: any exception escaping
// `command` is written to `err` as "Error: <what>" and yields exit code 1.
int run_guarded(const std::function<int()>& command, std::ostream& err);

} // namespace tile_develop::core
