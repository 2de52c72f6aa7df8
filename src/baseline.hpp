#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ssmpatch {

// Patch baseline to create (or reuse) and the patch group it serves.
// Approval rules and filters pass through to the remote system untouched.
struct BaselineDescriptor {
    std::string name;
    std::string operating_system;
    std::string patch_group;
    std::string description;
    std::optional<std::string> baseline_id;  // reuse an existing baseline
    nlohmann::json approval_rules;           // null when absent
    nlohmann::json global_filters;           // null when absent
    std::vector<std::string> approved_patches;
    std::vector<std::string> rejected_patches;
    std::string approved_patches_compliance_level;
};

// Parse a descriptor document. Throws LoadError on schema violations.
BaselineDescriptor parse_baseline(const nlohmann::json& doc);

// Read and parse a JSON descriptor file. Throws LoadError when the file is
// missing, unreadable, not JSON, or fails the schema.
BaselineDescriptor load_baseline(const std::string& path);

} // namespace ssmpatch
