#pragma once
#include "credentials.hpp"
#include "../config.hpp"
#include "../control_plane.hpp"
#include "../http.hpp"
#include <ctime>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace ssmpatch {

// ControlPlane backed by the AWS SSM JSON 1.1 API.
// Requests are SigV4-signed; listings follow NextToken until exhausted.
// No retries: a rejected call surfaces as RemoteOperationError.
class SsmClient : public ControlPlane {
public:
    using Clock = std::function<std::time_t()>;

    SsmClient(HttpClient& http, Credentials credentials, std::string region,
              std::string endpoint = "", long timeout_seconds = 30);

    std::string create_patch_baseline(const BaselineDescriptor& baseline) override;
    void register_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                 const std::string& patch_group) override;
    std::string create_maintenance_window(const MaintenanceWindowRequest& request) override;
    std::string register_target_with_maintenance_window(const TargetRequest& request) override;
    std::string register_task_with_maintenance_window(const TaskRequest& request) override;

    std::vector<WindowInfo> list_maintenance_windows() override;
    std::vector<TaskInfo> list_maintenance_window_tasks(const std::string& window_id) override;
    std::vector<PatchGroupRegistration> list_patch_group_registrations() override;
    std::vector<BaselineInfo> list_custom_patch_baselines() override;

    void deregister_task_from_maintenance_window(const std::string& window_id,
                                                 const std::string& task_id) override;
    void delete_maintenance_window(const std::string& window_id) override;
    void deregister_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                   const std::string& patch_group) override;
    void delete_patch_baseline(const std::string& baseline_id) override;

    // One cheap listing call against the endpoint. An unreachable endpoint or
    // rejected credentials become AuthResolutionError; other rejections
    // propagate as RemoteOperationError.
    void verify_region();

    // Single signed API call; returns the decoded response body.
    nlohmann::json call(const std::string& operation, const nlohmann::json& request);

    const std::string& endpoint() const { return endpoint_; }
    const std::string& region() const { return region_; }

    // Test hook for deterministic signatures
    void set_clock(Clock clock) { clock_ = std::move(clock); }

    static std::string default_endpoint(const std::string& region);

private:
    std::vector<nlohmann::json> paginate(const std::string& operation,
                                         nlohmann::json request,
                                         const std::string& items_key);

    HttpClient& http_;
    Credentials credentials_;
    std::string region_;
    std::string endpoint_;
    std::string host_;
    std::string path_;
    long timeout_seconds_;
    Clock clock_;

    static constexpr const char* TARGET_PREFIX = "AmazonSSM.";
    static constexpr const char* CONTENT_TYPE = "application/x-amz-json-1.1";
};

// Resolve region and credentials through the ambient chain (override, env,
// config, shared AWS files), build a client and verify the region answers.
// Throws AuthResolutionError.
std::unique_ptr<SsmClient> connect_ssm(HttpClient& http, const Config& config,
                                       const std::optional<std::string>& region_override);

} // namespace ssmpatch
