#include "ownership.hpp"

#include <algorithm>

namespace ssmpatch {

namespace {

// window id -> its task records, in snapshot order
std::map<std::string, std::vector<const ManagedResourceRecord*>>
tasks_by_window(const Inventory& inventory) {
    std::map<std::string, std::vector<const ManagedResourceRecord*>> out;
    for (const auto& r : inventory) {
        if (r.kind == ResourceKind::Task) out[r.parent_window_id].push_back(&r);
    }
    return out;
}

OwnershipVerdict verdict_for(const std::vector<const ManagedResourceRecord*>& tasks) {
    if (tasks.empty()) return OwnershipVerdict::Empty;
    bool all_patching = std::all_of(tasks.begin(), tasks.end(),
        [](const ManagedResourceRecord* t) { return is_patching_action(t->action); });
    return all_patching ? OwnershipVerdict::WhollyOwned : OwnershipVerdict::PartiallyForeign;
}

} // namespace

const char* verdict_to_string(OwnershipVerdict verdict) {
    switch (verdict) {
        case OwnershipVerdict::WhollyOwned: return "wholly-owned";
        case OwnershipVerdict::PartiallyForeign: return "partially-foreign";
        case OwnershipVerdict::Empty: return "empty";
    }
    return "partially-foreign";
}

bool is_patching_action(const std::string& action) {
    return action == kApplyPatchBaselineAction || action == kRunPatchBaselineAction;
}

bool is_deletable(OwnershipVerdict verdict) {
    return verdict == OwnershipVerdict::WhollyOwned || verdict == OwnershipVerdict::Empty;
}

std::map<std::string, OwnershipVerdict> classify(const Inventory& inventory) {
    auto tasks = tasks_by_window(inventory);
    static const std::vector<const ManagedResourceRecord*> kNoTasks;

    std::map<std::string, OwnershipVerdict> verdicts;
    for (const auto& r : inventory) {
        if (r.kind != ResourceKind::Window) continue;
        auto it = tasks.find(r.id);
        verdicts[r.id] = verdict_for(it == tasks.end() ? kNoTasks : it->second);
    }
    return verdicts;
}

std::set<std::string> registrations_to_remove(const Inventory& inventory) {
    std::set<std::string> ids;
    for (const auto& r : inventory) {
        if (r.kind == ResourceKind::BaselineRegistration) ids.insert(r.id);
    }
    return ids;
}

std::set<std::string> custom_baselines_to_remove(const Inventory& inventory) {
    std::set<std::string> ids;
    for (const auto& r : inventory) {
        if (r.kind == ResourceKind::CustomBaseline) ids.insert(r.id);
    }
    return ids;
}

size_t DecommissionPlan::operation_count() const {
    size_t n = registrations.size() + baselines.size();
    for (const auto& w : windows) n += 1 + w.task_ids.size();
    return n;
}

DecommissionPlan plan_decommission(const Inventory& inventory) {
    DecommissionPlan plan;
    auto verdicts = classify(inventory);
    auto tasks = tasks_by_window(inventory);

    std::map<std::string, std::string> names;
    for (const auto& r : inventory) {
        if (r.kind == ResourceKind::Window) names.emplace(r.id, r.name);
    }

    for (const auto& [window_id, verdict] : verdicts) {
        auto it = tasks.find(window_id);
        if (!is_deletable(verdict)) {
            RetainedWindow kept{window_id, names[window_id], {}};
            for (const auto* t : it->second) {
                if (!is_patching_action(t->action)) kept.foreign_actions.push_back(t->action);
            }
            plan.retained.push_back(std::move(kept));
            continue;
        }
        WindowTeardown teardown{window_id, names[window_id], verdict, {}};
        if (it != tasks.end()) {
            for (const auto* t : it->second) teardown.task_ids.push_back(t->id);
        }
        plan.windows.push_back(std::move(teardown));
    }

    auto registration_ids = registrations_to_remove(inventory);
    for (const auto& r : inventory) {
        if (r.kind != ResourceKind::BaselineRegistration) continue;
        if (registration_ids.erase(r.id) == 0) continue;   // duplicate record
        plan.registrations.push_back({r.id, r.baseline_id, r.patch_group});
    }

    auto baseline_ids = custom_baselines_to_remove(inventory);
    plan.baselines.assign(baseline_ids.begin(), baseline_ids.end());
    return plan;
}

} // namespace ssmpatch
