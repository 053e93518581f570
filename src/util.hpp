#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace sandlot {

// ISO 8601 UTC timestamp with milliseconds, e.g. 2025-01-31T12:00:00.123Z
std::string timestamp_now();

// Milliseconds on the steady clock, for durations
uint64_t monotonic_ms();

// Trim whitespace
std::string trim(const std::string& s);

// Join with a separator
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Random RFC 4122 version 4 UUID, lowercase hex
std::string generate_uuid();

// Cut to at most `max_chars` code points without splitting a UTF-8 sequence
std::string utf8_truncate(const std::string& s, size_t max_chars);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Read a whole file; throws std::runtime_error if it cannot be opened
std::string read_file(const std::string& path);

// Write via a temp file and rename. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

} // namespace sandlot
