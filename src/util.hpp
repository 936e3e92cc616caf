#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace multichat {

// Unix epoch milliseconds
uint64_t epoch_millis();

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// Generate a simple unique ID (hex)
std::string generate_id();

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write content to a sibling temp file and rename it over path.
// Creates missing parent directories. Returns false on any I/O error.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace multichat
