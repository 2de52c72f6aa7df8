#include "aws/ssm_client.hpp"
#include "baseline.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "log.hpp"
#include "provisioner.hpp"
#include "schedule.hpp"
#include "schedule_format.hpp"
#include "summary.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
#include <iomanip>
#include <iostream>

static std::atomic<bool> g_shutdown{false};

static void signal_handler(int /*sig*/) {
    g_shutdown.store(true);
}

struct HttpSession {
    HttpSession() { ssmpatch::http_init(); }
    ~HttpSession() { ssmpatch::http_cleanup(); }
    HttpSession(const HttpSession&) = delete;
    HttpSession& operator=(const HttpSession&) = delete;
};

static void print_results(const std::vector<ssmpatch::ProvisionResult>& results) {
    std::cout << std::left << std::setw(32) << "WINDOW" << std::setw(26) << "SCHEDULE"
              << std::setw(24) << "WINDOW ID" << "STATUS\n";
    for (const auto& r : results) {
        std::cout << std::left << std::setw(32)
                  << (r.window_name.empty() ? "-" : r.window_name)
                  << std::setw(26) << ssmpatch::schedule_expression(r.spec)
                  << std::setw(24) << (r.window_id.empty() ? "-" : r.window_id)
                  << (r.ok() ? "ok" : "FAILED: " + r.error) << "\n";
    }
}

int main(int argc, char* argv[]) try {
    using namespace ssmpatch;

    SetupOptions opts;
    try {
        opts = parse_setup_args(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_setup_usage(std::cerr);
        return kExitConfigError;
    }
    if (opts.help) {
        print_setup_usage(std::cout);
        return kExitOk;
    }

    init_logging(opts.log_level.value_or(env_value("SSMPATCH_LOG_LEVEL").value_or("info")));
    auto config = Config::load();
    if (!opts.log_level) init_logging(config.log_level);

    std::vector<RecurrenceSpec> specs;
    BaselineDescriptor baseline;
    try {
        config.validate();
        specs = expand(opts.expansion_request());
        baseline = load_baseline(opts.baseline_file);
    } catch (const ConfigurationError& e) {
        log_error("invalid configuration", {str_field("error", e.what())});
        return kExitConfigError;
    } catch (const LoadError& e) {
        log_error("cannot load baseline", {str_field("path", opts.baseline_file),
                                           str_field("error", e.what())});
        return kExitConfigError;
    }
    log_info("schedule expanded", {int_field("windows", static_cast<int64_t>(specs.size())),
                                   str_field("timezone", opts.timezone.value_or("default"))});

    HttpSession http_session;
    CurlHttpClient http_client;
    std::unique_ptr<SsmClient> client;
    try {
        client = connect_ssm(http_client, config, opts.region);
    } catch (const AuthResolutionError& e) {
        log_error("cannot resolve AWS credentials or region", {str_field("error", e.what())});
        return kExitAuthError;
    }

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    ProvisionOptions popts;
    popts.window = config.window;
    popts.task = config.task;
    popts.max_workers = config.max_workers;
    popts.cancel = &g_shutdown;

    OperationSummary summary;
    Provisioner provisioner(*client, popts, summary);
    auto results = provisioner.provision(specs, baseline);

    print_results(results);
    summary.log_report("provisioning");
    return summary.ok() ? kExitOk : kExitResourceFailures;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return ssmpatch::kExitResourceFailures;
}
