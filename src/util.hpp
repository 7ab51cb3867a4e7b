#pragma once
#include <string>
#include <cstdint>

namespace ptrnotes {

// Format epoch seconds as ISO 8601 (UTC)
std::string format_timestamp(uint64_t epoch);

// Unix epoch seconds
uint64_t epoch_seconds();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lowercase
std::string to_lower(const std::string& s);

// Generate a simple unique ID (hex). Safe to call from any thread.
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename, creating parent directories.
// Returns false if the file could not be written.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace ptrnotes
