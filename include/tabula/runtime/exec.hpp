#pragma once

#include <cstddef>
#include <functional>

namespace tabula::runtime {

/// Execution settings for per-partition work.
///
/// Partition computations are independent, so they may run on several
/// threads. User functions must then be safe to call concurrently, which is
/// why the default is single-threaded.
struct ExecOptions {
    /// Upper bound on worker threads; 0 means std::thread::hardware_concurrency().
    std::size_t max_threads = 1;
    /// Minimum number of partitions before work is spread over threads.
    std::size_t parallel_min_partitions = 64;

    /// Read TABULA_THREADS and TABULA_PARALLEL_MIN_PARTITIONS; unset or
    /// malformed variables keep the defaults.
    [[nodiscard]] static auto from_env() -> ExecOptions;
};

/// Number of threads `for_each_index` would use for `count` tasks.
[[nodiscard]] auto worker_count(std::size_t count, const ExecOptions& options) -> std::size_t;

/// Invoke task(i) for every i in [0, count). Work is split into contiguous
/// chunks across threads when the options allow it. The first exception
/// thrown by any task is rethrown after all workers have finished.
void for_each_index(std::size_t count, const ExecOptions& options,
                    const std::function<void(std::size_t)>& task);

}  // namespace tabula::runtime
