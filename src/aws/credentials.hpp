#pragma once
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace ssmpatch {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;   // empty for long-term keys
};

// section -> key -> value
using IniSections = std::map<std::string, std::map<std::string, std::string>>;

// Minimal INI reader for the shared AWS files: [section] headers, key = value
// pairs, '#' and ';' comments. Keys are lowercased.
IniSections parse_ini(std::istream& in);

// Empty when the file does not exist.
IniSections read_ini_file(const std::string& path);

// "us-east-1", "eu-central-2", "us-gov-west-1", "ap-southeast-4" ...
bool is_valid_region(const std::string& region);

std::string shared_credentials_path();
std::string shared_config_path();

// First hit wins: explicit override, AWS_REGION, AWS_DEFAULT_REGION,
// configured_region, then the shared config file profile.
// Throws AuthResolutionError when nothing resolves or the result is malformed.
std::string resolve_region(const std::optional<std::string>& override_region,
                           const std::string& configured_region,
                           const std::string& profile);

// Environment keys, then the shared credentials file, then the shared config
// file. Throws AuthResolutionError when no complete key pair is found.
Credentials resolve_credentials(const std::string& profile);

} // namespace ssmpatch
