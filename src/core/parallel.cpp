#include "photomosaic/core/parallel.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <thread>
#include <vector>

namespace photomosaic::core {

void parallel_for_index(std::size_t count, int workers,
                        const std::function<void(std::size_t)>& fn) {
    if (count == 0) return;

    const std::size_t n_workers = std::min<std::size_t>(
        static_cast<std::size_t>(std::max(1, workers)), count);

    if (n_workers <= 1) {
        for (std::size_t i = 0; i < count; ++i) {
            fn(i);
        }
        return;
    }

    std::atomic<std::size_t> next{0};
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;
    std::mutex error_mutex;

    std::vector<std::thread> threads;
    threads.reserve(n_workers);
    for (std::size_t w = 0; w < n_workers; ++w) {
        threads.emplace_back([&]() {
            while (!failed.load()) {
                std::size_t i = next.fetch_add(1);
                if (i >= count) break;
                try {
                    fn(i);
                } catch (...) {
                    std::lock_guard<std::mutex> lock(error_mutex);
                    if (!first_error) first_error = std::current_exception();
                    failed.store(true);
                }
            }
        });
    }

    for (auto& t : threads) {
        t.join();
    }

    if (first_error) {
        std::rethrow_exception(first_error);
    }
}

} // namespace photomosaic::core
