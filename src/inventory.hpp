#pragma once
#include "control_plane.hpp"
#include <string>
#include <vector>

namespace ssmpatch {

enum class ResourceKind { Window, Task, BaselineRegistration, CustomBaseline };

const char* resource_kind_to_string(ResourceKind kind);

// One remote resource as seen by the scanner. Field use depends on kind:
//   Task                 -> action, parent_window_id
//   BaselineRegistration -> patch_group, baseline_id
struct ManagedResourceRecord {
    ResourceKind kind = ResourceKind::Window;
    std::string id;
    std::string name;
    std::string description;
    std::string action;
    std::string parent_window_id;
    std::string patch_group;
    std::string baseline_id;
};

using Inventory = std::vector<ManagedResourceRecord>;

// Registrations have no remote id of their own: "<baseline_id>:<patch_group>"
std::string registration_id(const std::string& baseline_id, const std::string& patch_group);

ManagedResourceRecord window_record(const std::string& id, const std::string& name = "",
                                    const std::string& description = "");
ManagedResourceRecord task_record(const std::string& id, const std::string& window_id,
                                  const std::string& action, const std::string& name = "");
ManagedResourceRecord registration_record(const std::string& baseline_id,
                                          const std::string& patch_group,
                                          const std::string& baseline_name = "");
ManagedResourceRecord custom_baseline_record(const std::string& id,
                                             const std::string& name = "",
                                             const std::string& description = "");

// Capture a complete snapshot: every window, the tasks of every window, every
// patch-group registration and every custom baseline. Any listing failure
// propagates (RemoteOperationError); no partial snapshot is ever returned.
Inventory scan_inventory(ControlPlane& plane);

} // namespace ssmpatch
