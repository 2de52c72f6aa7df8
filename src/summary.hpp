#pragma once
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace ssmpatch {

struct FailureRecord {
    std::string kind;        // window, task, target, baseline, ...
    std::string id;          // remote id, or a name when no id exists yet
    std::string operation;
    std::string message;
};

// Per-resource outcome ledger shared by concurrent workers.
class OperationSummary {
public:
    void record_success(const std::string& kind, const std::string& id,
                        const std::string& operation);
    void record_failure(const std::string& kind, const std::string& id,
                        const std::string& operation, const std::string& message);
    void record_skipped(size_t count);

    size_t succeeded() const;
    size_t failed() const;
    size_t skipped() const;
    std::vector<FailureRecord> failures() const;

    // No failures and nothing skipped
    bool ok() const;

    // Log totals plus one line per failure
    void log_report(const std::string& title) const;

private:
    mutable std::mutex mutex_;
    size_t succeeded_ = 0;
    size_t skipped_ = 0;
    std::vector<FailureRecord> failures_;
};

} // namespace ssmpatch
