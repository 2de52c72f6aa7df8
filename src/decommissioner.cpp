#include "decommissioner.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "worker_pool.hpp"

namespace ssmpatch {

size_t log_retained_windows(const DecommissionPlan& plan) {
    for (const auto& kept : plan.retained) {
        std::string actions;
        for (const auto& a : kept.foreign_actions) {
            if (!actions.empty()) actions += ',';
            actions += a;
        }
        log_info("leaving window untouched: not wholly owned",
                 {str_field("window", kept.window_id), str_field("name", kept.name),
                  str_field("foreign_actions", actions)});
    }
    return plan.retained.size();
}

Decommissioner::Decommissioner(ControlPlane& plane, DecommissionOptions options,
                               OperationSummary& summary)
    : plane_(plane), options_(options), summary_(summary) {}

bool Decommissioner::cancelled() const {
    return options_.cancel && options_.cancel->load();
}

void Decommissioner::teardown_window(const WindowTeardown& window) {
    for (size_t i = 0; i < window.task_ids.size(); ++i) {
        const auto& task_id = window.task_ids[i];
        if (cancelled()) {
            // Remaining tasks plus the window itself
            summary_.record_skipped(window.task_ids.size() - i + 1);
            log_warn("teardown cancelled", {str_field("window", window.window_id)});
            return;
        }
        try {
            plane_.deregister_task_from_maintenance_window(window.window_id, task_id);
            summary_.record_success("task", task_id, "DeregisterTaskFromMaintenanceWindow");
        } catch (const RemoteOperationError& e) {
            summary_.record_failure("task", task_id, "DeregisterTaskFromMaintenanceWindow",
                                    e.what());
        }
    }

    // Every task deletion above has been attempted by now
    if (cancelled()) {
        summary_.record_skipped(1);
        log_warn("teardown cancelled", {str_field("window", window.window_id)});
        return;
    }
    try {
        plane_.delete_maintenance_window(window.window_id);
        summary_.record_success("window", window.window_id, "DeleteMaintenanceWindow");
    } catch (const RemoteOperationError& e) {
        summary_.record_failure("window", window.window_id, "DeleteMaintenanceWindow",
                                e.what());
    }
}

void Decommissioner::remove_registration(const RegistrationRemoval& registration) {
    try {
        plane_.deregister_patch_baseline_for_patch_group(registration.baseline_id,
                                                         registration.patch_group);
        summary_.record_success("baseline-registration", registration.id,
                                "DeregisterPatchBaselineForPatchGroup");
    } catch (const RemoteOperationError& e) {
        summary_.record_failure("baseline-registration", registration.id,
                                "DeregisterPatchBaselineForPatchGroup", e.what());
    }
}

void Decommissioner::remove_baseline(const std::string& baseline_id) {
    try {
        plane_.delete_patch_baseline(baseline_id);
        summary_.record_success("custom-baseline", baseline_id, "DeletePatchBaseline");
    } catch (const RemoteOperationError& e) {
        summary_.record_failure("custom-baseline", baseline_id, "DeletePatchBaseline",
                                e.what());
    }
}

void Decommissioner::run(const DecommissionPlan& plan) {
    std::vector<Job> phase1;
    for (const auto& window : plan.windows) {
        phase1.push_back([this, &window]() { teardown_window(window); });
    }
    for (const auto& registration : plan.registrations) {
        phase1.push_back([this, &registration]() { remove_registration(registration); });
    }
    summary_.record_skipped(run_bounded(phase1, options_.max_workers, options_.cancel));

    std::vector<Job> phase2;
    for (const auto& baseline_id : plan.baselines) {
        phase2.push_back([this, &baseline_id]() { remove_baseline(baseline_id); });
    }
    summary_.record_skipped(run_bounded(phase2, options_.max_workers, options_.cancel));
}

} // namespace ssmpatch
