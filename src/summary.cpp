#include "summary.hpp"
#include "log.hpp"

namespace ssmpatch {

void OperationSummary::record_success(const std::string& kind, const std::string& id,
                                      const std::string& operation) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ++succeeded_;
    }
    log_info(operation + " succeeded", {str_field("kind", kind), str_field("id", id)});
}

void OperationSummary::record_failure(const std::string& kind, const std::string& id,
                                      const std::string& operation,
                                      const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures_.push_back({kind, id, operation, message});
    }
    log_error(operation + " failed",
              {str_field("kind", kind), str_field("id", id), str_field("error", message)});
}

void OperationSummary::record_skipped(size_t count) {
    if (count == 0) return;
    std::lock_guard<std::mutex> lock(mutex_);
    skipped_ += count;
}

size_t OperationSummary::succeeded() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return succeeded_;
}

size_t OperationSummary::failed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.size();
}

size_t OperationSummary::skipped() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return skipped_;
}

std::vector<FailureRecord> OperationSummary::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}

bool OperationSummary::ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_.empty() && skipped_ == 0;
}

void OperationSummary::log_report(const std::string& title) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto level = failures_.empty() ? spdlog::level::info : spdlog::level::warn;
    log(level, title + " finished",
        {int_field("succeeded", static_cast<int64_t>(succeeded_)),
         int_field("failed", static_cast<int64_t>(failures_.size())),
         int_field("skipped", static_cast<int64_t>(skipped_))});
    for (const auto& f : failures_) {
        log_error("  failed: " + f.operation,
                  {str_field("kind", f.kind), str_field("id", f.id),
                   str_field("error", f.message)});
    }
}

} // namespace ssmpatch
