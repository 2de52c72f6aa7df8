#pragma once
#include "control_plane.hpp"
#include "ownership.hpp"
#include "summary.hpp"
#include <atomic>

namespace ssmpatch {

struct DecommissionOptions {
    size_t max_workers = 1;
    const std::atomic<bool>* cancel = nullptr;
};

// One info line per window the plan leaves alone; returns how many.
size_t log_retained_windows(const DecommissionPlan& plan);

// Executes a DecommissionPlan.
//   phase 1: window teardowns (tasks, then the window) and registrations
//   phase 2: custom baselines, which the remote side refuses to delete while
//            still registered to a patch group
// A failed call is recorded and never stops unrelated deletions.
class Decommissioner {
public:
    Decommissioner(ControlPlane& plane, DecommissionOptions options, OperationSummary& summary);

    void run(const DecommissionPlan& plan);

private:
    bool cancelled() const;
    void teardown_window(const WindowTeardown& window);
    void remove_registration(const RegistrationRemoval& registration);
    void remove_baseline(const std::string& baseline_id);

    ControlPlane& plane_;
    DecommissionOptions options_;
    OperationSummary& summary_;
};

} // namespace ssmpatch
