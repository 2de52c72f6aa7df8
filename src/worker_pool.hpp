#pragma once
#include <atomic>
#include <cstddef>
#include <functional>
#include <vector>

namespace ssmpatch {

using Job = std::function<void()>;

// Run each job at most once on up to `max_workers` threads (<= 1 runs them
// sequentially on the calling thread). Jobs are started in vector order. Once
// `*cancel` reads true no further job starts; running jobs are left to finish.
// Returns the number of jobs that were never started. If a job throws, the
// first exception is rethrown after all workers have joined.
size_t run_bounded(const std::vector<Job>& jobs, size_t max_workers,
                   const std::atomic<bool>* cancel = nullptr);

} // namespace ssmpatch
