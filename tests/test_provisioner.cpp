#include <catch2/catch_test_macros.hpp>
#include "ownership.hpp"
#include "provisioner.hpp"
#include "schedule_format.hpp"
#include "fake_control_plane.hpp"

using namespace ssmpatch;

static BaselineDescriptor make_baseline() {
    BaselineDescriptor b;
    b.name = "linux-baseline";
    b.operating_system = "AMAZON_LINUX_2";
    b.patch_group = "web";
    return b;
}

static std::vector<RecurrenceSpec> default_specs() {
    return expand({1, 2}, {Weekday::Tuesday, Weekday::Wednesday}, {3, 4}, std::nullopt);
}

// ── Baseline handling ────────────────────────────────────────────

TEST_CASE("Provisioner: creates and registers the baseline before any window", "[provisioner]") {
    FakeControlPlane plane;
    OperationSummary summary;
    Provisioner prov(plane, ProvisionOptions{}, summary);

    auto results = prov.provision(default_specs(), make_baseline());

    REQUIRE(results.size() == 8);
    REQUIRE(prov.baseline_id().value() == "pb-0001");
    REQUIRE(prov.registration_created());

    auto registrations = plane.calls_with_prefix("RegisterPatchBaselineForPatchGroup:");
    REQUIRE(registrations == std::vector<std::string>{"RegisterPatchBaselineForPatchGroup:pb-0001:web"});

    long reg_index = plane.index_of("RegisterPatchBaselineForPatchGroup:pb-0001:web");
    for (const auto& w : plane.calls_with_prefix("CreateMaintenanceWindow:")) {
        REQUIRE(plane.index_of(w) > reg_index);
    }
    REQUIRE(plane.index_of("CreatePatchBaseline:linux-baseline") < reg_index);
    REQUIRE(summary.ok());
    // baseline + registration + 8 x (window, target, task)
    REQUIRE(summary.succeeded() == 26);
}

TEST_CASE("Provisioner: an existing baseline id is reused", "[provisioner]") {
    FakeControlPlane plane;
    OperationSummary summary;
    Provisioner prov(plane, ProvisionOptions{}, summary);

    auto baseline = make_baseline();
    baseline.baseline_id = "pb-existing";
    prov.provision({RecurrenceSpec(1, Weekday::Tuesday, 3)}, baseline);

    REQUIRE(plane.calls_with_prefix("CreatePatchBaseline:").empty());
    REQUIRE(plane.index_of("RegisterPatchBaselineForPatchGroup:pb-existing:web") == 0);
    REQUIRE(prov.baseline_id().value() == "pb-existing");
}

TEST_CASE("Provisioner: failed baseline creation skips registration only", "[provisioner]") {
    FakeControlPlane plane;
    plane.failing = {"CreatePatchBaseline:linux-baseline"};
    OperationSummary summary;
    Provisioner prov(plane, ProvisionOptions{}, summary);

    auto results = prov.provision(default_specs(), make_baseline());

    REQUIRE_FALSE(prov.baseline_id().has_value());
    REQUIRE_FALSE(prov.registration_created());
    REQUIRE(plane.calls_with_prefix("RegisterPatchBaselineForPatchGroup:").empty());
    REQUIRE(plane.calls_with_prefix("CreateMaintenanceWindow:").size() == 8);
    REQUIRE(summary.failed() == 1);
    REQUIRE(summary.failures()[0].operation == "CreatePatchBaseline");
    for (const auto& r : results) REQUIRE(r.ok());
}

// ── Per-window creation ──────────────────────────────────────────

TEST_CASE("Provisioner: results follow the input order", "[provisioner]") {
    FakeControlPlane plane;
    OperationSummary summary;
    ProvisionOptions options;
    options.max_workers = 4;
    Provisioner prov(plane, options, summary);

    auto specs = default_specs();
    auto results = prov.provision(specs, make_baseline());

    REQUIRE(results.size() == specs.size());
    for (size_t i = 0; i < specs.size(); ++i) {
        REQUIRE(results[i].spec == specs[i]);
        REQUIRE(results[i].window_name == window_name("patching", specs[i]));
        REQUIRE(results[i].window_id == "mw-" + results[i].window_name);
        REQUIRE(results[i].target_id == "tg-" + results[i].window_id);
        REQUIRE(results[i].task_id == "tk-" + results[i].window_id);
        REQUIRE(results[i].ok());
    }
}

TEST_CASE("Provisioner: requests carry schedule and task settings", "[provisioner]") {
    FakeControlPlane plane;
    OperationSummary summary;
    ProvisionOptions options;
    options.window.name_prefix = "prod";
    options.window.duration_hours = 4;
    options.window.cutoff_hours = 2;
    options.task.action = kApplyPatchBaselineAction;
    options.task.operation = "Scan";
    options.task.max_concurrency = "10";
    options.task.max_errors = "1";
    options.task.priority = 5;
    Provisioner prov(plane, options, summary);

    RecurrenceSpec spec(3, Weekday::Friday, 22, std::string("Europe/Berlin"));
    prov.provision({spec}, make_baseline());

    REQUIRE(plane.window_requests.size() == 1);
    const auto& w = plane.window_requests[0];
    REQUIRE(w.name == "prod-week3-fri-2200");
    REQUIRE(w.schedule == "cron(0 22 ? * FRI#3 *)");
    REQUIRE(w.timezone.value() == "Europe/Berlin");
    REQUIRE(w.duration_hours == 4);
    REQUIRE(w.cutoff_hours == 2);
    REQUIRE(w.description == window_description(spec));

    REQUIRE(plane.target_requests.size() == 1);
    REQUIRE(plane.target_requests[0].window_id == "mw-prod-week3-fri-2200");
    REQUIRE(plane.target_requests[0].patch_group == "web");

    REQUIRE(plane.task_requests.size() == 1);
    const auto& t = plane.task_requests[0];
    REQUIRE(t.target_id == "tg-mw-prod-week3-fri-2200");
    REQUIRE(t.name == "prod-week3-fri-2200-task");
    REQUIRE(t.action == kApplyPatchBaselineAction);
    REQUIRE(t.operation == "Scan");
    REQUIRE(t.max_concurrency == "10");
    REQUIRE(t.max_errors == "1");
    REQUIRE(t.priority == 5);
}

TEST_CASE("Provisioner: one failed window does not stop its siblings", "[provisioner]") {
    FakeControlPlane plane;
    plane.failing = {"CreateMaintenanceWindow:patching-week1-tue-0300",
                     "RegisterTaskWithMaintenanceWindow:mw-patching-week2-wed-0400"};
    OperationSummary summary;
    ProvisionOptions options;
    options.max_workers = 3;
    Provisioner prov(plane, options, summary);

    auto results = prov.provision(default_specs(), make_baseline());

    size_t ok = 0;
    for (const auto& r : results) {
        if (r.ok()) {
            ++ok;
            continue;
        }
        REQUIRE_FALSE(r.error.empty());
        if (r.window_name == "patching-week1-tue-0300") {
            REQUIRE(r.window_id.empty());
            REQUIRE(r.target_id.empty());
        } else {
            REQUIRE(r.window_name == "patching-week2-wed-0400");
            REQUIRE_FALSE(r.target_id.empty());
            REQUIRE(r.task_id.empty());
        }
    }
    REQUIRE(ok == 6);
    REQUIRE(plane.calls_with_prefix("CreateMaintenanceWindow:").size() == 8);
    REQUIRE(plane.calls_with_prefix("RegisterTargetWithMaintenanceWindow:").size() == 7);
    REQUIRE(summary.failed() == 2);
    REQUIRE_FALSE(summary.ok());
    // Nothing is rolled back
    REQUIRE(plane.calls_with_prefix("Delete").empty());
    REQUIRE(plane.calls_with_prefix("Deregister").empty());
}

TEST_CASE("Provisioner: cancellation before dispatch starts nothing", "[provisioner]") {
    FakeControlPlane plane;
    OperationSummary summary;
    std::atomic<bool> cancel{true};
    ProvisionOptions options;
    options.cancel = &cancel;
    Provisioner prov(plane, options, summary);

    auto results = prov.provision(default_specs(), make_baseline());

    REQUIRE(plane.calls.empty());
    REQUIRE(summary.skipped() == 8);
    REQUIRE_FALSE(summary.ok());
    for (const auto& r : results) REQUIRE(r.error == "cancelled before dispatch");
}

// Raises the cancel flag once a chosen call has gone out
namespace {

class CancellingControlPlane : public FakeControlPlane {
public:
    CancellingControlPlane(std::atomic<bool>& flag, std::string trigger)
        : flag_(flag), trigger_(std::move(trigger)) {}

    std::string create_maintenance_window(const MaintenanceWindowRequest& request) override {
        auto id = FakeControlPlane::create_maintenance_window(request);
        if (trigger_ == "window") flag_.store(true);
        return id;
    }

    std::string register_target_with_maintenance_window(const TargetRequest& request) override {
        auto id = FakeControlPlane::register_target_with_maintenance_window(request);
        if (trigger_ == "target") flag_.store(true);
        return id;
    }

private:
    std::atomic<bool>& flag_;
    std::string trigger_;
};

} // namespace

TEST_CASE("Provisioner: cancel after window creation stops its target and task", "[provisioner]") {
    std::atomic<bool> cancel{false};
    CancellingControlPlane plane(cancel, "window");
    OperationSummary summary;
    ProvisionOptions options;
    options.cancel = &cancel;
    Provisioner prov(plane, options, summary);

    auto results = prov.provision(default_specs(), make_baseline());

    REQUIRE(plane.calls_with_prefix("CreateMaintenanceWindow:").size() == 1);
    REQUIRE(plane.calls_with_prefix("RegisterTargetWithMaintenanceWindow:").empty());
    REQUIRE(plane.calls_with_prefix("RegisterTaskWithMaintenanceWindow:").empty());

    REQUIRE_FALSE(results[0].window_id.empty());
    REQUIRE(results[0].error == "cancelled before target registration");
    for (size_t i = 1; i < results.size(); ++i) {
        REQUIRE(results[i].error == "cancelled before dispatch");
    }
    REQUIRE(summary.skipped() == 8);
    REQUIRE_FALSE(summary.ok());
}

TEST_CASE("Provisioner: cancel after target registration stops the task", "[provisioner]") {
    std::atomic<bool> cancel{false};
    CancellingControlPlane plane(cancel, "target");
    OperationSummary summary;
    ProvisionOptions options;
    options.cancel = &cancel;
    Provisioner prov(plane, options, summary);

    auto results = prov.provision({RecurrenceSpec(1, Weekday::Tuesday, 3)}, make_baseline());

    REQUIRE(plane.calls_with_prefix("RegisterTargetWithMaintenanceWindow:").size() == 1);
    REQUIRE(plane.calls_with_prefix("RegisterTaskWithMaintenanceWindow:").empty());
    REQUIRE(results[0].error == "cancelled before task registration");
    REQUIRE_FALSE(results[0].ok());
    REQUIRE(summary.skipped() == 1);
}
