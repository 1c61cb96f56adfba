#include <kdeflow/runtime/parallel.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace kdeflow::runtime {

auto resolve_thread_count(std::size_t requested, std::size_t work_items) -> std::size_t {
    std::size_t threads = requested;
    if (threads == 0) {
        threads = std::max<unsigned>(1, std::thread::hardware_concurrency());
    }
    return std::max<std::size_t>(1, std::min(threads, work_items));
}

auto parallel_for(std::size_t n, std::size_t threads, const std::function<bool(std::size_t)>& body)
    -> bool {
    if (threads <= 1 || n <= 1) {
        for (std::size_t i = 0; i < n; ++i) {
            if (!body(i)) {
                return false;
            }
        }
        return true;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> cancelled{false};
    std::mutex error_mutex;
    std::exception_ptr error;

    auto worker = [&] {
        while (!cancelled.load(std::memory_order_acquire)) {
            const std::size_t i = next.fetch_add(1, std::memory_order_relaxed);
            if (i >= n) {
                return;
            }
            try {
                if (!body(i)) {
                    cancelled.store(true, std::memory_order_release);
                }
            } catch (...) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!error) {
                    error = std::current_exception();
                }
                cancelled.store(true, std::memory_order_release);
            }
        }
    };

    const std::size_t count = std::min(threads, n);
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (std::size_t t = 0; t < count; ++t) {
        workers.emplace_back(worker);
    }
    for (auto& th : workers) {
        th.join();
    }
    if (error) {
        std::rethrow_exception(error);
    }
    return !cancelled.load();
}

}  // namespace kdeflow::runtime
