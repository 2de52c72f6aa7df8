#include "credentials.hpp"
#include "../errors.hpp"
#include "../util.hpp"

#include <cctype>
#include <fstream>

namespace ssmpatch {

IniSections parse_ini(std::istream& in) {
    IniSections sections;
    std::string current;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';') continue;
        if (t.front() == '[' && t.back() == ']') {
            current = trim(t.substr(1, t.size() - 2));
            sections[current];
            continue;
        }
        auto eq = t.find('=');
        if (eq == std::string::npos || current.empty()) continue;
        std::string key = to_lower(trim(t.substr(0, eq)));
        std::string value = trim(t.substr(eq + 1));
        if (!key.empty()) sections[current][key] = value;
    }
    return sections;
}

IniSections read_ini_file(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) return {};
    return parse_ini(file);
}

bool is_valid_region(const std::string& region) {
    // <partition>[-gov|-iso...]-<direction>-<digit>
    auto parts = split(region, '-');
    if (parts.size() < 3 || parts.size() > 4) return false;
    if (parts[0].size() != 2) return false;
    for (size_t i = 0; i + 1 < parts.size(); ++i) {
        if (parts[i].empty()) return false;
        for (char c : parts[i]) {
            if (!std::islower(static_cast<unsigned char>(c))) return false;
        }
    }
    const std::string& num = parts.back();
    if (num.empty() || num.size() > 2) return false;
    for (char c : num) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

std::string shared_credentials_path() {
    if (auto p = env_value("AWS_SHARED_CREDENTIALS_FILE")) return expand_home(*p);
    return expand_home("~/.aws/credentials");
}

std::string shared_config_path() {
    if (auto p = env_value("AWS_CONFIG_FILE")) return expand_home(*p);
    return expand_home("~/.aws/config");
}

static const std::map<std::string, std::string>* config_profile(const IniSections& config,
                                                                const std::string& profile) {
    auto it = config.find(profile == "default" ? "default" : "profile " + profile);
    if (it == config.end() && profile != "default") it = config.find(profile);
    return it == config.end() ? nullptr : &it->second;
}

static std::string lookup(const std::map<std::string, std::string>& section,
                          const std::string& key) {
    auto it = section.find(key);
    return it == section.end() ? std::string() : it->second;
}

std::string resolve_region(const std::optional<std::string>& override_region,
                           const std::string& configured_region,
                           const std::string& profile) {
    std::string region;
    std::string source;
    if (override_region && !override_region->empty()) {
        region = *override_region;
        source = "--region";
    } else if (auto v = env_value("AWS_REGION")) {
        region = *v;
        source = "AWS_REGION";
    } else if (auto v2 = env_value("AWS_DEFAULT_REGION")) {
        region = *v2;
        source = "AWS_DEFAULT_REGION";
    } else if (!configured_region.empty()) {
        region = configured_region;
        source = "config file";
    } else {
        auto config = read_ini_file(shared_config_path());
        if (const auto* section = config_profile(config, profile)) {
            region = lookup(*section, "region");
            source = shared_config_path();
        }
    }

    region = trim(region);
    if (region.empty()) {
        throw AuthResolutionError(
            "Could not establish region. Specify --region or set AWS_REGION");
    }
    if (!is_valid_region(region)) {
        throw AuthResolutionError("Invalid region '" + region + "' (from " + source + ")");
    }
    return region;
}

Credentials resolve_credentials(const std::string& profile) {
    auto key_id = env_value("AWS_ACCESS_KEY_ID");
    auto secret = env_value("AWS_SECRET_ACCESS_KEY");
    if (key_id && secret) {
        Credentials creds{*key_id, *secret, env_value("AWS_SESSION_TOKEN").value_or("")};
        return creds;
    }

    auto from_section = [](const std::map<std::string, std::string>& s)
        -> std::optional<Credentials> {
        Credentials c{lookup(s, "aws_access_key_id"), lookup(s, "aws_secret_access_key"),
                      lookup(s, "aws_session_token")};
        if (c.access_key_id.empty() || c.secret_access_key.empty()) return std::nullopt;
        return c;
    };

    auto creds_file = read_ini_file(shared_credentials_path());
    auto it = creds_file.find(profile);
    if (it != creds_file.end()) {
        if (auto c = from_section(it->second)) return *c;
    }

    auto config = read_ini_file(shared_config_path());
    if (const auto* section = config_profile(config, profile)) {
        if (auto c = from_section(*section)) return *c;
    }

    throw AuthResolutionError("No AWS credentials found for profile '" + profile +
                              "'. Set AWS_ACCESS_KEY_ID/AWS_SECRET_ACCESS_KEY or configure " +
                              shared_credentials_path());
}

} // namespace ssmpatch
