#include "ipc/bounded_queue.hpp"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>

int main() {
    durin::ipc::BoundedQueue<int> queue(100);
    if (!queue.valid()) {
        std::cerr << "queue invalid\n";
        return 1;
    }

    std::atomic<bool> running{true};
    int consumed = 0;
    std::thread producer([&]() {
        for (int i = 0; i < 50000; ++i) {
            (void)queue.tryPush(i);
        }
        running.store(false);
    });

    int first = -1;
    int last = -1;
    bool ordered = true;
    while (running.load() || queue.size() > 0U) {
        const auto v = queue.tryPop();
        if (v) {
            if (first < 0) {
                first = *v;
            }
            if (*v <= last) {
                ordered = false;
            }
            last = *v;
            consumed++;
            std::this_thread::sleep_for(std::chrono::microseconds(50));
        } else {
            std::this_thread::sleep_for(std::chrono::microseconds(20));
        }
    }
    producer.join();

    if (queue.dropCount() == 0U) {
        std::cerr << "expected drops under overload\n";
        return 1;
    }
    if (!ordered) {
        std::cerr << "kept items should stay in FIFO order\n";
        return 1;
    }
    if (first != 0) {
        std::cerr << "drop-new policy should keep the oldest item (first=" << first << ")\n";
        return 1;
    }
    if (static_cast<uint64_t>(consumed) + queue.dropCount() != 50000U) {
        std::cerr << "every push should be either consumed or counted as dropped\n";
        return 1;
    }
    return 0;
}
