#include "baseline.hpp"
#include "errors.hpp"
#include "util.hpp"

#include <fstream>

namespace ssmpatch {

using json = nlohmann::json;

namespace {

std::string required_string(const json& doc, const char* key) {
    if (!doc.contains(key) || !doc[key].is_string()) {
        throw LoadError(std::string("Baseline field '") + key + "' must be a string");
    }
    std::string value = trim(doc[key].get<std::string>());
    if (value.empty()) {
        throw LoadError(std::string("Baseline field '") + key + "' must not be empty");
    }
    return value;
}

std::vector<std::string> string_list(const json& doc, const char* key) {
    std::vector<std::string> out;
    if (!doc.contains(key)) return out;
    if (!doc[key].is_array()) {
        throw LoadError(std::string("Baseline field '") + key + "' must be an array");
    }
    for (const auto& item : doc[key]) {
        if (!item.is_string()) {
            throw LoadError(std::string("Baseline field '") + key +
                            "' must contain only strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

json optional_object(const json& doc, const char* key) {
    if (!doc.contains(key) || doc[key].is_null()) return nullptr;
    if (!doc[key].is_object()) {
        throw LoadError(std::string("Baseline field '") + key + "' must be an object");
    }
    return doc[key];
}

} // namespace

BaselineDescriptor parse_baseline(const json& doc) {
    if (!doc.is_object()) {
        throw LoadError("Baseline document must be a JSON object");
    }

    BaselineDescriptor b;
    b.name = required_string(doc, "name");
    b.operating_system = required_string(doc, "operating_system");
    b.patch_group = required_string(doc, "patch_group");

    if (doc.contains("description")) {
        if (!doc["description"].is_string())
            throw LoadError("Baseline field 'description' must be a string");
        b.description = doc["description"].get<std::string>();
    }
    if (doc.contains("baseline_id") && !doc["baseline_id"].is_null()) {
        b.baseline_id = required_string(doc, "baseline_id");
    }
    if (doc.contains("approved_patches_compliance_level")) {
        b.approved_patches_compliance_level =
            required_string(doc, "approved_patches_compliance_level");
    }

    b.approval_rules = optional_object(doc, "approval_rules");
    b.global_filters = optional_object(doc, "global_filters");
    b.approved_patches = string_list(doc, "approved_patches");
    b.rejected_patches = string_list(doc, "rejected_patches");
    return b;
}

BaselineDescriptor load_baseline(const std::string& path) {
    std::string resolved = expand_home(path);
    std::ifstream file(resolved);
    if (!file.is_open()) {
        throw LoadError("Cannot open baseline file: " + resolved);
    }

    json doc;
    try {
        doc = json::parse(file);
    } catch (const json::parse_error& e) {
        throw LoadError("Malformed baseline file " + resolved + ": " + e.what());
    }
    return parse_baseline(doc);
}

} // namespace ssmpatch
