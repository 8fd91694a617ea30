#pragma once

#include <algorithm>
#include <atomic>
#include <cstddef>
#include <thread>
#include <vector>

namespace relpack {

// Joins the wrapped thread when it goes out of scope
struct ThreadGuard {
    std::thread t;
    ThreadGuard() = default;
    explicit ThreadGuard(std::thread&& th) : t(std::move(th)) {}
    ThreadGuard(const ThreadGuard&) = delete;
    ThreadGuard& operator=(const ThreadGuard&) = delete;
    ThreadGuard(ThreadGuard&& other) noexcept : t(std::move(other.t)) {}
    ThreadGuard& operator=(ThreadGuard&&) = delete;
    ~ThreadGuard() {
        if (t.joinable()) t.join();
    }
};

// Calls fn(i) for every i in [0, count) on at most `jobs` threads. Items
// are handed out in index order; fn must only touch state owned by item i.
// With jobs <= 1 everything runs on the calling thread.
template<typename Fn>
void run_parallel(size_t count, int jobs, Fn&& fn) {
    size_t workers = jobs > 1 ? std::min(static_cast<size_t>(jobs), count) : 1;
    if (workers <= 1) {
        for (size_t i = 0; i < count; ++i) fn(i);
        return;
    }

    std::atomic<size_t> next{0};
    auto worker = [&]() {
        for (size_t i = next++; i < count; i = next++) fn(i);
    };

    std::vector<ThreadGuard> pool;
    pool.reserve(workers - 1);
    for (size_t w = 1; w < workers; ++w) pool.emplace_back(std::thread(worker));
    worker();
}

} // namespace relpack
