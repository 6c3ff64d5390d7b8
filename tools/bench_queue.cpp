#include "ipc/bounded_queue.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>

int main() {
    using Clock = std::chrono::steady_clock;
    constexpr int kIters = 200000;

    durin::ipc::BoundedQueue<uint64_t> queue(100);
    if (!queue.valid()) {
        std::cerr << "queue invalid\n";
        return 1;
    }

    std::vector<int64_t> lat_ns;
    lat_ns.reserve(kIters);

    for (int i = 0; i < kIters; ++i) {
        const auto t0 = Clock::now();
        const uint64_t stamp = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(t0.time_since_epoch()).count());
        (void)queue.tryPush(stamp);

        std::optional<uint64_t> out;
        while (!(out = queue.tryPop())) {
        }
        const auto t1 = Clock::now();
        const int64_t now_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1.time_since_epoch()).count();
        lat_ns.push_back(now_ns - static_cast<int64_t>(*out));
    }

    std::sort(lat_ns.begin(), lat_ns.end());
    auto pct = [&](double p) -> int64_t {
        const std::size_t idx = static_cast<std::size_t>(p * static_cast<double>(lat_ns.size() - 1));
        return lat_ns[idx];
    };

    // Burst past capacity from a second thread; every extra item is dropped.
    durin::ipc::BoundedQueue<uint64_t> burst(100);
    std::thread producer([&burst]() {
        for (uint64_t i = 0; i < 1000; ++i) {
            (void)burst.tryPush(i);
        }
    });
    producer.join();

    std::cout << "bench_queue_iterations " << kIters << "\n";
    std::cout << "latency_ns_p50 " << pct(0.50) << "\n";
    std::cout << "latency_ns_p95 " << pct(0.95) << "\n";
    std::cout << "latency_ns_p99 " << pct(0.99) << "\n";
    std::cout << "drops " << queue.dropCount() << "\n";
    std::cout << "burst_kept " << burst.size() << " burst_drops " << burst.dropCount() << "\n";
    return 0;
}
