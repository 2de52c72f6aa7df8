#pragma once
#include "inventory.hpp"
#include <map>
#include <set>
#include <string>
#include <vector>

namespace ssmpatch {

// The only two actions this tool ever attaches to a window
constexpr const char* kApplyPatchBaselineAction = "AWS-ApplyPatchBaseline";
constexpr const char* kRunPatchBaselineAction = "AWS-RunPatchBaseline";

enum class OwnershipVerdict {
    WhollyOwned,       // >= 1 task, all patching: delete tasks, then window
    PartiallyForeign,  // some non-patching task: touch nothing
    Empty              // no tasks: delete window only
};

const char* verdict_to_string(OwnershipVerdict verdict);

bool is_patching_action(const std::string& action);

bool is_deletable(OwnershipVerdict verdict);

// All functions below are pure over the snapshot. They never depend on record
// order beyond producing a deterministic result.

std::map<std::string, OwnershipVerdict> classify(const Inventory& inventory);

// Every baseline-to-group registration is owned by convention
std::set<std::string> registrations_to_remove(const Inventory& inventory);

// Every custom baseline is owned by convention; predefined ones are never listed
std::set<std::string> custom_baselines_to_remove(const Inventory& inventory);

struct WindowTeardown {
    std::string window_id;
    std::string name;
    OwnershipVerdict verdict = OwnershipVerdict::Empty;
    std::vector<std::string> task_ids;   // deleted before the window
};

struct RetainedWindow {
    std::string window_id;
    std::string name;
    std::vector<std::string> foreign_actions;
};

struct RegistrationRemoval {
    std::string id;
    std::string baseline_id;
    std::string patch_group;
};

struct DecommissionPlan {
    std::vector<WindowTeardown> windows;
    std::vector<RetainedWindow> retained;
    std::vector<RegistrationRemoval> registrations;
    std::vector<std::string> baselines;

    // Number of delete/deregister calls the plan will issue
    size_t operation_count() const;
    bool empty() const { return operation_count() == 0; }
};

DecommissionPlan plan_decommission(const Inventory& inventory);

} // namespace ssmpatch
