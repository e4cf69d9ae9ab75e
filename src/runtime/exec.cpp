#include <tabula/runtime/exec.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <exception>
#include <mutex>
#include <optional>
#include <string_view>
#include <system_error>
#include <thread>
#include <vector>

namespace tabula::runtime {

namespace {

auto env_size(const char* name) -> std::optional<std::size_t> {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }
    std::string_view text{raw};
    std::size_t value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc() || ptr != text.data() + text.size()) {
        spdlog::warn("ignoring malformed {}='{}'", name, text);
        return std::nullopt;
    }
    return value;
}

}  // namespace

auto ExecOptions::from_env() -> ExecOptions {
    ExecOptions options;
    if (auto threads = env_size("TABULA_THREADS")) {
        options.max_threads = *threads;
    }
    if (auto min_partitions = env_size("TABULA_PARALLEL_MIN_PARTITIONS")) {
        options.parallel_min_partitions = *min_partitions;
    }
    return options;
}

auto worker_count(std::size_t count, const ExecOptions& options) -> std::size_t {
    std::size_t limit = options.max_threads;
    if (limit == 0) {
        limit = std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    if (limit <= 1 || count < std::max<std::size_t>(2, options.parallel_min_partitions)) {
        return 1;
    }
    return std::min(limit, count);
}

void for_each_index(std::size_t count, const ExecOptions& options,
                    const std::function<void(std::size_t)>& task) {
    const std::size_t threads = worker_count(count, options);
    if (threads <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            task(i);
        }
        return;
    }

    spdlog::debug("dispatching {} partitions over {} threads", count, threads);
    const std::size_t chunk = (count + threads - 1) / threads;
    std::exception_ptr first_error;
    std::mutex error_mutex;
    std::vector<std::thread> workers;
    workers.reserve(threads);
    auto join_all = [&workers] {
        for (auto& worker : workers) {
            worker.join();
        }
    };
    try {
        for (std::size_t t = 0; t < threads; ++t) {
            std::size_t start = t * chunk;
            if (start >= count) {
                break;
            }
            std::size_t end = std::min(count, start + chunk);
            workers.emplace_back([&, start, end] {
                try {
                    for (std::size_t i = start; i < end; ++i) {
                        task(i);
                    }
                } catch (...) {
                    std::lock_guard lock(error_mutex);
                    if (!first_error) {
                        first_error = std::current_exception();
                    }
                }
            });
        }
    } catch (const std::system_error& e) {
        // Started workers must finish before their std::thread objects die.
        spdlog::warn("could not start worker thread: {}", e.what());
        join_all();
        throw;
    }
    join_all();
    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

}  // namespace tabula::runtime
