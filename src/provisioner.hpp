#pragma once
#include "baseline.hpp"
#include "config.hpp"
#include "control_plane.hpp"
#include "schedule.hpp"
#include "summary.hpp"
#include <atomic>
#include <optional>
#include <string>
#include <vector>

namespace ssmpatch {

struct ProvisionOptions {
    WindowConfig window;
    TaskConfig task;
    size_t max_workers = 1;
    const std::atomic<bool>* cancel = nullptr;
};

struct ProvisionResult {
    explicit ProvisionResult(RecurrenceSpec s) : spec(std::move(s)) {}

    RecurrenceSpec spec;
    std::string window_name;
    std::string window_id;
    std::string target_id;
    std::string task_id;
    std::string error;      // first failure for this recurrence, empty on success

    bool ok() const { return error.empty() && !task_id.empty(); }
};

// Creates one window + target + patching task per recurrence, after making sure the
// baseline exists and is registered for its patch group (once per run).
// Remote failures are recorded in the summary and never abort sibling specs.
// Nothing is rolled back.
class Provisioner {
public:
    Provisioner(ControlPlane& plane, ProvisionOptions options, OperationSummary& summary);

    // Results are in the same order as `specs`.
    std::vector<ProvisionResult> provision(const std::vector<RecurrenceSpec>& specs,
                                           const BaselineDescriptor& baseline);

    // Baseline used by the last run (reused or created), if any
    const std::optional<std::string>& baseline_id() const { return baseline_id_; }
    bool registration_created() const { return registration_created_; }

private:
    bool cancelled() const;
    // Records the skip when cancellation was requested after the window existed
    bool stop_after(ProvisionResult& result, const char* next_step);
    void prepare_baseline(const BaselineDescriptor& baseline);
    void provision_window(ProvisionResult& result, const BaselineDescriptor& baseline);

    ControlPlane& plane_;
    ProvisionOptions options_;
    OperationSummary& summary_;
    std::optional<std::string> baseline_id_;
    bool registration_created_ = false;
};

} // namespace ssmpatch
