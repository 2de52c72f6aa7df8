#include "ssm_client.hpp"
#include "sigv4.hpp"
#include "../errors.hpp"
#include "../log.hpp"

#include <utility>

using json = nlohmann::json;

namespace ssmpatch {

namespace {

std::string string_field(const json& obj, const char* key) {
    if (obj.contains(key) && obj[key].is_string()) return obj[key].get<std::string>();
    return {};
}

std::string require_string(const json& resp, const std::string& operation, const char* key) {
    std::string value = string_field(resp, key);
    if (value.empty()) {
        throw RemoteOperationError(operation, 200, "MalformedResponse",
                                   std::string("missing ") + key);
    }
    return value;
}

// "com.amazonaws.ssm#DoesNotExistException" -> "DoesNotExistException"
std::string short_error_type(const std::string& type) {
    auto hash = type.rfind('#');
    std::string t = hash == std::string::npos ? type : type.substr(hash + 1);
    auto colon = t.find(':');
    return colon == std::string::npos ? t : t.substr(0, colon);
}

bool is_credential_rejection(const RemoteOperationError& e) {
    static const char* const kTypes[] = {
        "UnrecognizedClientException", "InvalidSignatureException",
        "InvalidClientTokenId", "ExpiredTokenException", "MissingAuthenticationToken"
    };
    for (const char* t : kTypes) {
        if (e.error_type() == t) return true;
    }
    return e.status_code() == 403;
}

} // namespace

SsmClient::SsmClient(HttpClient& http, Credentials credentials, std::string region,
                     std::string endpoint, long timeout_seconds)
    : http_(http), credentials_(std::move(credentials)), region_(std::move(region)),
      endpoint_(endpoint.empty() ? default_endpoint(region_) : std::move(endpoint)),
      timeout_seconds_(timeout_seconds),
      clock_([]() { return std::time(nullptr); }) {
    auto scheme = endpoint_.find("://");
    std::string rest = scheme == std::string::npos ? endpoint_ : endpoint_.substr(scheme + 3);
    auto slash = rest.find('/');
    host_ = slash == std::string::npos ? rest : rest.substr(0, slash);
    path_ = slash == std::string::npos ? "/" : rest.substr(slash);
}

std::string SsmClient::default_endpoint(const std::string& region) {
    std::string suffix = region.rfind("cn-", 0) == 0 ? ".amazonaws.com.cn" : ".amazonaws.com";
    return "https://ssm." + region + suffix + "/";
}

json SsmClient::call(const std::string& operation, const json& request) {
    std::string body = request.dump();
    std::vector<Header> headers = {
        {"content-type", CONTENT_TYPE},
        {"x-amz-target", std::string(TARGET_PREFIX) + operation}
    };
    auto signed_headers = sign_request("POST", host_, path_, headers, body, credentials_,
                                       {region_, "ssm"}, clock_());

    log_debug("ssm request", {str_field("operation", operation)});
    auto response = http_.post(endpoint_, body, signed_headers, timeout_seconds_);

    if (response.status_code == 0) {
        throw RemoteOperationError(operation, 0, "TransportError",
                                   response.error.empty() ? "no response" : response.error);
    }

    if (response.status_code < 200 || response.status_code >= 300) {
        std::string type;
        std::string message = response.body;
        try {
            auto err = json::parse(response.body);
            type = short_error_type(string_field(err, "__type"));
            message = string_field(err, "message");
            if (message.empty()) message = string_field(err, "Message");
        } catch (const json::exception&) { // NOLINT(bugprone-empty-catch)
            // Non-JSON error body: report it verbatim
        }
        throw RemoteOperationError(operation, response.status_code, type, message);
    }

    if (response.body.empty()) return json::object();
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw RemoteOperationError(operation, response.status_code, "MalformedResponse",
                                   e.what());
    }
}

std::vector<json> SsmClient::paginate(const std::string& operation, json request,
                                      const std::string& items_key) {
    std::vector<json> items;
    while (true) {
        auto resp = call(operation, request);
        if (resp.contains(items_key) && resp[items_key].is_array()) {
            for (auto& item : resp[items_key]) items.push_back(std::move(item));
        }
        std::string token = string_field(resp, "NextToken");
        if (token.empty()) break;
        request["NextToken"] = token;
    }
    return items;
}

// ── create ───────────────────────────────────────────────────────

std::string SsmClient::create_patch_baseline(const BaselineDescriptor& baseline) {
    json req = {
        {"Name", baseline.name},
        {"OperatingSystem", baseline.operating_system}
    };
    if (!baseline.description.empty()) req["Description"] = baseline.description;
    if (!baseline.approval_rules.is_null()) req["ApprovalRules"] = baseline.approval_rules;
    if (!baseline.global_filters.is_null()) req["GlobalFilters"] = baseline.global_filters;
    if (!baseline.approved_patches.empty()) req["ApprovedPatches"] = baseline.approved_patches;
    if (!baseline.rejected_patches.empty()) req["RejectedPatches"] = baseline.rejected_patches;
    if (!baseline.approved_patches_compliance_level.empty())
        req["ApprovedPatchesComplianceLevel"] = baseline.approved_patches_compliance_level;

    auto resp = call("CreatePatchBaseline", req);
    return require_string(resp, "CreatePatchBaseline", "BaselineId");
}

void SsmClient::register_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                        const std::string& patch_group) {
    call("RegisterPatchBaselineForPatchGroup",
         {{"BaselineId", baseline_id}, {"PatchGroup", patch_group}});
}

std::string SsmClient::create_maintenance_window(const MaintenanceWindowRequest& request) {
    json req = {
        {"Name", request.name},
        {"Schedule", request.schedule},
        {"Duration", request.duration_hours},
        {"Cutoff", request.cutoff_hours},
        {"AllowUnassociatedTargets", request.allow_unassociated_targets}
    };
    if (!request.description.empty()) req["Description"] = request.description;
    if (request.timezone) req["ScheduleTimezone"] = *request.timezone;

    auto resp = call("CreateMaintenanceWindow", req);
    return require_string(resp, "CreateMaintenanceWindow", "WindowId");
}

std::string SsmClient::register_target_with_maintenance_window(const TargetRequest& request) {
    json req = {
        {"WindowId", request.window_id},
        {"ResourceType", "INSTANCE"},
        {"Targets", json::array({{{"Key", "tag:Patch Group"},
                                  {"Values", json::array({request.patch_group})}}})}
    };
    if (!request.name.empty()) req["Name"] = request.name;

    auto resp = call("RegisterTargetWithMaintenanceWindow", req);
    return require_string(resp, "RegisterTargetWithMaintenanceWindow", "WindowTargetId");
}

std::string SsmClient::register_task_with_maintenance_window(const TaskRequest& request) {
    json req = {
        {"WindowId", request.window_id},
        {"Targets", json::array({{{"Key", "WindowTargetIds"},
                                  {"Values", json::array({request.target_id})}}})},
        {"TaskArn", request.action},
        {"TaskType", "RUN_COMMAND"},
        {"TaskInvocationParameters",
         {{"RunCommand",
           {{"Parameters", {{"Operation", json::array({request.operation})}}}}}}},
        {"MaxConcurrency", request.max_concurrency},
        {"MaxErrors", request.max_errors},
        {"Priority", request.priority}
    };
    if (!request.name.empty()) req["Name"] = request.name;

    auto resp = call("RegisterTaskWithMaintenanceWindow", req);
    return require_string(resp, "RegisterTaskWithMaintenanceWindow", "WindowTaskId");
}

// ── list ─────────────────────────────────────────────────────────

std::vector<WindowInfo> SsmClient::list_maintenance_windows() {
    std::vector<WindowInfo> out;
    for (const auto& item : paginate("DescribeMaintenanceWindows", {{"MaxResults", 50}},
                                     "WindowIdentities")) {
        out.push_back({string_field(item, "WindowId"), string_field(item, "Name"),
                       string_field(item, "Description")});
    }
    return out;
}

std::vector<TaskInfo> SsmClient::list_maintenance_window_tasks(const std::string& window_id) {
    std::vector<TaskInfo> out;
    for (const auto& item : paginate("DescribeMaintenanceWindowTasks",
                                     {{"WindowId", window_id}, {"MaxResults", 100}},
                                     "Tasks")) {
        std::string parent = string_field(item, "WindowId");
        out.push_back({string_field(item, "WindowTaskId"),
                       parent.empty() ? window_id : parent,
                       string_field(item, "TaskArn"),
                       string_field(item, "Name")});
    }
    return out;
}

std::vector<PatchGroupRegistration> SsmClient::list_patch_group_registrations() {
    std::vector<PatchGroupRegistration> out;
    for (const auto& item : paginate("DescribePatchGroups", {{"MaxResults", 100}},
                                     "Mappings")) {
        PatchGroupRegistration reg;
        reg.patch_group = string_field(item, "PatchGroup");
        if (item.contains("BaselineIdentity") && item["BaselineIdentity"].is_object()) {
            reg.baseline_id = string_field(item["BaselineIdentity"], "BaselineId");
            reg.baseline_name = string_field(item["BaselineIdentity"], "BaselineName");
        }
        out.push_back(std::move(reg));
    }
    return out;
}

std::vector<BaselineInfo> SsmClient::list_custom_patch_baselines() {
    json req = {
        {"Filters", json::array({{{"Key", "OWNER"}, {"Values", json::array({"Self"})}}})},
        {"MaxResults", 100}
    };
    std::vector<BaselineInfo> out;
    for (const auto& item : paginate("DescribePatchBaselines", req, "BaselineIdentities")) {
        out.push_back({string_field(item, "BaselineId"), string_field(item, "BaselineName"),
                       string_field(item, "BaselineDescription"),
                       string_field(item, "OperatingSystem")});
    }
    return out;
}

// ── delete ───────────────────────────────────────────────────────

void SsmClient::deregister_task_from_maintenance_window(const std::string& window_id,
                                                        const std::string& task_id) {
    call("DeregisterTaskFromMaintenanceWindow",
         {{"WindowId", window_id}, {"WindowTaskId", task_id}});
}

void SsmClient::delete_maintenance_window(const std::string& window_id) {
    call("DeleteMaintenanceWindow", {{"WindowId", window_id}});
}

void SsmClient::deregister_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                          const std::string& patch_group) {
    call("DeregisterPatchBaselineForPatchGroup",
         {{"BaselineId", baseline_id}, {"PatchGroup", patch_group}});
}

void SsmClient::delete_patch_baseline(const std::string& baseline_id) {
    call("DeletePatchBaseline", {{"BaselineId", baseline_id}});
}

// ── session ──

void SsmClient::verify_region() {
    try {
        call("DescribeMaintenanceWindows", {{"MaxResults", 10}});
    } catch (const RemoteOperationError& e) {
        if (e.status_code() == 0) {
            throw AuthResolutionError("Region '" + region_ + "' is not reachable at " +
                                      endpoint_ + ": " + e.what());
        }
        if (is_credential_rejection(e)) {
            throw AuthResolutionError("Credentials rejected in region '" + region_ +
                                      "': " + e.what());
        }
        throw;
    }
}

std::unique_ptr<SsmClient> connect_ssm(HttpClient& http, const Config& config,
                                       const std::optional<std::string>& region_override) {
    std::string region = resolve_region(region_override, config.region, config.profile);
    Credentials credentials = resolve_credentials(config.profile);
    auto client = std::make_unique<SsmClient>(http, std::move(credentials), region,
                                              config.endpoint, config.request_timeout);
    client->verify_region();
    log_info("connected", {str_field("region", region), str_field("profile", config.profile),
                           str_field("endpoint", client->endpoint())});
    return client;
}

} // namespace ssmpatch
