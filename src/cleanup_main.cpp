#include "aws/ssm_client.hpp"
#include "cli.hpp"
#include "config.hpp"
#include "decommissioner.hpp"
#include "errors.hpp"
#include "http.hpp"
#include "inventory.hpp"
#include "log.hpp"
#include "ownership.hpp"
#include "summary.hpp"
#include "util.hpp"
#include <atomic>
#include <csignal>
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

int main(int argc, char* argv[]) try {
    using namespace ssmpatch;

    CleanupOptions opts;
    try {
        opts = parse_cleanup_args(argc, argv);
    } catch (const ConfigurationError& e) {
        std::cerr << "Error: " << e.what() << "\n\n";
        print_cleanup_usage(std::cerr);
        return kExitConfigError;
    }
    if (opts.help) {
        print_cleanup_usage(std::cout);
        return kExitOk;
    }

    init_logging(opts.log_level.value_or(env_value("SSMPATCH_LOG_LEVEL").value_or("info")));
    auto config = Config::load();
    if (!opts.log_level) init_logging(config.log_level);

    try {
        config.validate_connection();
    } catch (const ConfigurationError& e) {
        log_error("invalid configuration", {str_field("error", e.what())});
        return kExitConfigError;
    }

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

    // Deletion decisions come only from a complete snapshot
    Inventory inventory;
    try {
        inventory = scan_inventory(*client);
    } catch (const RemoteOperationError& e) {
        log_error("inventory scan failed, nothing deleted", {str_field("error", e.what())});
        return kExitResourceFailures;
    }

    auto plan = plan_decommission(inventory);
    log_info("decommission plan",
             {int_field("windows", static_cast<int64_t>(plan.windows.size())),
              int_field("windows_retained", static_cast<int64_t>(plan.retained.size())),
              int_field("registrations", static_cast<int64_t>(plan.registrations.size())),
              int_field("custom_baselines", static_cast<int64_t>(plan.baselines.size()))});
    log_retained_windows(plan);
    if (plan.empty()) {
        log_info("nothing to delete");
        return kExitOk;
    }

    OperationSummary summary;
    Decommissioner decommissioner(*client, {config.max_workers, &g_shutdown}, summary);
    decommissioner.run(plan);

    summary.log_report("decommissioning");
    return summary.ok() ? kExitOk : kExitResourceFailures;
} catch (const std::exception& e) {
    std::cerr << "Fatal: " << e.what() << "\n";
    return ssmpatch::kExitResourceFailures;
}
