#include "provisioner.hpp"
#include "errors.hpp"
#include "log.hpp"
#include "schedule_format.hpp"
#include "worker_pool.hpp"

namespace ssmpatch {

Provisioner::Provisioner(ControlPlane& plane, ProvisionOptions options,
                         OperationSummary& summary)
    : plane_(plane), options_(std::move(options)), summary_(summary) {}

bool Provisioner::cancelled() const {
    return options_.cancel && options_.cancel->load();
}

void Provisioner::prepare_baseline(const BaselineDescriptor& baseline) {
    baseline_id_.reset();
    registration_created_ = false;

    if (baseline.baseline_id) {
        baseline_id_ = baseline.baseline_id;
        log_info("using existing patch baseline", {str_field("id", *baseline_id_)});
    } else {
        try {
            baseline_id_ = plane_.create_patch_baseline(baseline);
            summary_.record_success("baseline", *baseline_id_, "CreatePatchBaseline");
        } catch (const RemoteOperationError& e) {
            summary_.record_failure("baseline", baseline.name, "CreatePatchBaseline", e.what());
            return;
        }
    }

    if (cancelled()) return;

    try {
        plane_.register_patch_baseline_for_patch_group(*baseline_id_, baseline.patch_group);
        registration_created_ = true;
        summary_.record_success("baseline-registration",
                                *baseline_id_ + ":" + baseline.patch_group,
                                "RegisterPatchBaselineForPatchGroup");
    } catch (const RemoteOperationError& e) {
        summary_.record_failure("baseline-registration",
                                *baseline_id_ + ":" + baseline.patch_group,
                                "RegisterPatchBaselineForPatchGroup", e.what());
    }
}

// A window left without its task is classified empty and removed by cleanup
bool Provisioner::stop_after(ProvisionResult& result, const char* next_step) {
    if (!cancelled()) return false;
    result.error = std::string("cancelled before ") + next_step + " registration";
    summary_.record_skipped(1);
    log_warn("provisioning cancelled mid-window",
             {str_field("window", result.window_id), str_field("next_step", next_step)});
    return true;
}

void Provisioner::provision_window(ProvisionResult& result, const BaselineDescriptor& baseline) {
    const auto& spec = result.spec;
    result.window_name = window_name(options_.window.name_prefix, spec);

    MaintenanceWindowRequest window;
    window.name = result.window_name;
    window.description = window_description(spec);
    window.schedule = schedule_expression(spec);
    window.timezone = spec.timezone();
    window.duration_hours = options_.window.duration_hours;
    window.cutoff_hours = options_.window.cutoff_hours;
    window.allow_unassociated_targets = options_.window.allow_unassociated_targets;

    try {
        result.window_id = plane_.create_maintenance_window(window);
    } catch (const RemoteOperationError& e) {
        result.error = e.what();
        summary_.record_failure("window", result.window_name, "CreateMaintenanceWindow",
                                result.error);
        return;
    }
    summary_.record_success("window", result.window_id, "CreateMaintenanceWindow");

    if (stop_after(result, "target")) return;
    try {
        result.target_id = plane_.register_target_with_maintenance_window(
            {result.window_id, baseline.patch_group, baseline.patch_group});
    } catch (const RemoteOperationError& e) {
        result.error = e.what();
        summary_.record_failure("target", result.window_id,
                                "RegisterTargetWithMaintenanceWindow", result.error);
        return;
    }
    summary_.record_success("target", result.target_id, "RegisterTargetWithMaintenanceWindow");

    if (stop_after(result, "task")) return;

    TaskRequest task;
    task.window_id = result.window_id;
    task.target_id = result.target_id;
    task.name = result.window_name + "-task";
    task.action = options_.task.action;
    task.operation = options_.task.operation;
    task.max_concurrency = options_.task.max_concurrency;
    task.max_errors = options_.task.max_errors;
    task.priority = options_.task.priority;

    try {
        result.task_id = plane_.register_task_with_maintenance_window(task);
    } catch (const RemoteOperationError& e) {
        result.error = e.what();
        summary_.record_failure("task", result.window_id,
                                "RegisterTaskWithMaintenanceWindow", result.error);
        return;
    }
    summary_.record_success("task", result.task_id, "RegisterTaskWithMaintenanceWindow");
}

std::vector<ProvisionResult> Provisioner::provision(const std::vector<RecurrenceSpec>& specs,
                                                    const BaselineDescriptor& baseline) {
    std::vector<ProvisionResult> results;
    results.reserve(specs.size());
    for (const auto& spec : specs) results.emplace_back(spec);

    // Registration precedes every window and is shared by all of them
    if (!cancelled()) prepare_baseline(baseline);

    std::vector<Job> jobs;
    jobs.reserve(results.size());
    for (auto& result : results) {
        jobs.push_back([this, &result, &baseline]() { provision_window(result, baseline); });
    }

    size_t not_started = run_bounded(jobs, options_.max_workers, options_.cancel);
    if (not_started > 0) {
        for (auto& result : results) {
            if (result.window_name.empty()) result.error = "cancelled before dispatch";
        }
        summary_.record_skipped(not_started);
        log_warn("provisioning cancelled", {int_field("windows_not_started",
                                                      static_cast<int64_t>(not_started))});
    }
    return results;
}

} // namespace ssmpatch
