#pragma once
#include <string>
#include <vector>
#include <cstdint>

namespace pbrelay {

// Unix epoch seconds
uint64_t epoch_seconds();

// Unix epoch seconds with sub-second precision
double epoch_seconds_precise();

// Trim whitespace
std::string trim(const std::string& s);

// ASCII lower-case copy
std::string to_lower(std::string s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Write via temp file + rename. Creates parent directories. Returns false on failure.
bool atomic_write_file(const std::string& path, const std::string& content);

// Read a whole file, stripping surrounding whitespace. Empty if unreadable.
std::string read_trimmed_file(const std::string& path);

// Standard base64 (RFC 4648, with padding)
std::string base64_encode(const std::string& data);

// Decode base64; ignores whitespace, throws std::invalid_argument on bad input
std::string base64_decode(const std::string& encoded);

// 64-bit FNV-1a over fields joined with a 0x01 separator, as 16 hex chars
std::string fnv1a_hex(const std::vector<std::string>& fields);

// Debug-level logging toggle (--debug)
void set_verbose(bool on);
bool verbose();

} // namespace pbrelay
