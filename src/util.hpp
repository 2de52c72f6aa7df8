#pragma once
#include <string>
#include <vector>
#include <optional>
#include <ctime>

namespace ssmpatch {

// Trim whitespace
std::string trim(const std::string& s);

// Split string by delimiter
std::vector<std::string> split(const std::string& s, char delim);

// ASCII case conversion
std::string to_lower(const std::string& s);
std::string to_upper(const std::string& s);

// Expand ~ to home directory
std::string expand_home(const std::string& path);

// Value of an environment variable, nullopt when unset or empty
std::optional<std::string> env_value(const char* name);

// Lowercase hex of raw bytes
std::string hex_encode(const unsigned char* data, size_t len);

// UTC time formatted with strftime pattern
std::string format_utc(std::time_t t, const char* pattern);

} // namespace ssmpatch
