#include "inventory.hpp"
#include "log.hpp"

namespace ssmpatch {

const char* resource_kind_to_string(ResourceKind kind) {
    switch (kind) {
        case ResourceKind::Window: return "window";
        case ResourceKind::Task: return "task";
        case ResourceKind::BaselineRegistration: return "baseline-registration";
        case ResourceKind::CustomBaseline: return "custom-baseline";
    }
    return "unknown";
}

std::string registration_id(const std::string& baseline_id, const std::string& patch_group) {
    return baseline_id + ":" + patch_group;
}

ManagedResourceRecord window_record(const std::string& id, const std::string& name,
                                    const std::string& description) {
    ManagedResourceRecord r;
    r.kind = ResourceKind::Window;
    r.id = id;
    r.name = name;
    r.description = description;
    return r;
}

ManagedResourceRecord task_record(const std::string& id, const std::string& window_id,
                                  const std::string& action, const std::string& name) {
    ManagedResourceRecord r;
    r.kind = ResourceKind::Task;
    r.id = id;
    r.name = name;
    r.action = action;
    r.parent_window_id = window_id;
    return r;
}

ManagedResourceRecord registration_record(const std::string& baseline_id,
                                          const std::string& patch_group,
                                          const std::string& baseline_name) {
    ManagedResourceRecord r;
    r.kind = ResourceKind::BaselineRegistration;
    r.id = registration_id(baseline_id, patch_group);
    r.name = baseline_name;
    r.patch_group = patch_group;
    r.baseline_id = baseline_id;
    return r;
}

ManagedResourceRecord custom_baseline_record(const std::string& id, const std::string& name,
                                             const std::string& description) {
    ManagedResourceRecord r;
    r.kind = ResourceKind::CustomBaseline;
    r.id = id;
    r.name = name;
    r.description = description;
    return r;
}

Inventory scan_inventory(ControlPlane& plane) {
    Inventory inventory;

    auto windows = plane.list_maintenance_windows();
    for (const auto& w : windows) {
        inventory.push_back(window_record(w.id, w.name, w.description));
        for (const auto& t : plane.list_maintenance_window_tasks(w.id)) {
            inventory.push_back(task_record(t.id, w.id, t.action, t.name));
        }
    }

    auto registrations = plane.list_patch_group_registrations();
    for (const auto& reg : registrations) {
        inventory.push_back(registration_record(reg.baseline_id, reg.patch_group,
                                                reg.baseline_name));
    }

    auto baselines = plane.list_custom_patch_baselines();
    for (const auto& b : baselines) {
        inventory.push_back(custom_baseline_record(b.id, b.name, b.description));
    }

    log_info("inventory captured",
             {int_field("windows", static_cast<int64_t>(windows.size())),
              int_field("registrations", static_cast<int64_t>(registrations.size())),
              int_field("custom_baselines", static_cast<int64_t>(baselines.size())),
              int_field("records", static_cast<int64_t>(inventory.size()))});
    return inventory;
}

} // namespace ssmpatch
