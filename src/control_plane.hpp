#pragma once
#include "baseline.hpp"
#include <optional>
#include <string>
#include <vector>

namespace ssmpatch {

struct MaintenanceWindowRequest {
    std::string name;
    std::string description;
    std::string schedule;                  // remote recurrence rule
    std::optional<std::string> timezone;   // nullopt = remote default
    int duration_hours = 3;
    int cutoff_hours = 1;
    bool allow_unassociated_targets = false;
};

// Window target selecting instances by their Patch Group tag
struct TargetRequest {
    std::string window_id;
    std::string name;
    std::string patch_group;
};

struct TaskRequest {
    std::string window_id;
    std::string target_id;
    std::string name;
    std::string action;        // document run by the task, e.g. AWS-RunPatchBaseline
    std::string operation;     // Install | Scan
    std::string max_concurrency;
    std::string max_errors;
    int priority = 1;
};

struct WindowInfo {
    std::string id;
    std::string name;
    std::string description;
};

struct TaskInfo {
    std::string id;
    std::string window_id;
    std::string action;
    std::string name;
};

struct PatchGroupRegistration {
    std::string patch_group;
    std::string baseline_id;
    std::string baseline_name;
};

struct BaselineInfo {
    std::string id;
    std::string name;
    std::string description;
    std::string operating_system;
};

// Remote fleet-management API. Every call either succeeds or throws
// RemoteOperationError; listings return the complete (all pages) result.
class ControlPlane {
public:
    virtual ~ControlPlane() = default;

    // ── create ──
    virtual std::string create_patch_baseline(const BaselineDescriptor& baseline) = 0;
    virtual void register_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                         const std::string& patch_group) = 0;
    virtual std::string create_maintenance_window(const MaintenanceWindowRequest& request) = 0;
    virtual std::string register_target_with_maintenance_window(const TargetRequest& request) = 0;
    virtual std::string register_task_with_maintenance_window(const TaskRequest& request) = 0;

    // ── list ──
    virtual std::vector<WindowInfo> list_maintenance_windows() = 0;
    virtual std::vector<TaskInfo> list_maintenance_window_tasks(const std::string& window_id) = 0;
    virtual std::vector<PatchGroupRegistration> list_patch_group_registrations() = 0;
    // Baselines owned by the account; predefined baselines are never included
    virtual std::vector<BaselineInfo> list_custom_patch_baselines() = 0;

    // ── delete ──
    virtual void deregister_task_from_maintenance_window(const std::string& window_id,
                                                         const std::string& task_id) = 0;
    virtual void delete_maintenance_window(const std::string& window_id) = 0;
    virtual void deregister_patch_baseline_for_patch_group(const std::string& baseline_id,
                                                           const std::string& patch_group) = 0;
    virtual void delete_patch_baseline(const std::string& baseline_id) = 0;
};

} // namespace ssmpatch
