#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace exitforge {

// Fixed-size fan-out over independent jobs. Jobs write results by index, so
// output order never depends on scheduling.
class WorkerPool {
public:
    explicit WorkerPool(size_t threads = 0)
        : threads_(threads > 0 ? threads : defaultThreads()) {}

    size_t threadCount() const { return threads_; }

    // Calls fn(i) for every i in [0, count). The first exception thrown by a
    // job is rethrown here after all workers have joined.
    template<typename Fn>
    void forEachIndex(size_t count, Fn fn) const {
        if (count == 0) return;

        const size_t workers = std::min(threads_, count);
        if (workers <= 1) {
            for (size_t i = 0; i < count; ++i) {
                fn(i);
            }
            return;
        }

        std::atomic<size_t> next{0};
        std::atomic<bool> failed{false};
        std::exception_ptr first_error;
        std::mutex error_mutex;

        auto worker = [&]() {
            while (!failed.load()) {
                const size_t i = next.fetch_add(1);
                if (i >= count) break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed = true;
                }
            }
        };

        std::vector<std::thread> pool;
        pool.reserve(workers);
        for (size_t t = 0; t < workers; ++t) {
            pool.emplace_back(worker);
        }
        for (auto& th : pool) {
            th.join();
        }

        if (first_error) {
            std::rethrow_exception(first_error);
        }
    }

private:
    size_t threads_;

    static size_t defaultThreads() {
        const unsigned hw = std::thread::hardware_concurrency();
        return hw > 0 ? hw : 2;
    }
};

} // namespace exitforge
