#include "worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>

namespace ssmpatch {

size_t run_bounded(const std::vector<Job>& jobs, size_t max_workers,
                   const std::atomic<bool>* cancel) {
    std::atomic<size_t> next{0};
    std::atomic<size_t> not_started{0};
    std::mutex error_mutex;
    std::exception_ptr first_error;

    auto worker = [&]() {
        while (true) {
            size_t i = next.fetch_add(1);
            if (i >= jobs.size()) return;
            if (cancel && cancel->load()) {
                not_started.fetch_add(1);
                continue;
            }
            try {
                jobs[i]();
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error) first_error = std::current_exception();
            }
        }
    };

    size_t n = std::min(max_workers, jobs.size());
    if (n <= 1) {
        worker();
    } else {
        std::vector<std::thread> threads;
        threads.reserve(n);
        for (size_t i = 0; i < n; ++i) threads.emplace_back(worker);
        for (auto& t : threads) t.join();
    }

    if (first_error) std::rethrow_exception(first_error);
    return not_started.load();
}

} // namespace ssmpatch
