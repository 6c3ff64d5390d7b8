#pragma once

#include "core/config.hpp"
#include "ipc/bounded_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>

namespace durin::ipc {

struct WorkerCounters {
    std::atomic<uint64_t> iterations{0};
    std::atomic<uint64_t> items{0};
    std::atomic<uint64_t> dropped{0};
    std::atomic<uint64_t> errors{0};
};

struct WorkerStats {
    uint64_t iterations{0};
    uint64_t items{0};
    uint64_t dropped{0};
    uint64_t errors{0};
};

// Runs one step function in its own thread until stopped. The step returns
// true when it moved an item; otherwise the loop idles for idle_sleep_us.
//
// The thread co-owns its loop state, so a worker that misses the stop
// deadline is detached instead of joined. Step functions must therefore only
// capture state they co-own (shared_ptr) or plain values.
class LinkWorker {
public:
    using Step = std::function<bool(WorkerCounters&)>;

    LinkWorker(std::string name, const WorkerConfig& cfg, Step step);
    virtual ~LinkWorker();

    LinkWorker(const LinkWorker&) = delete;
    LinkWorker& operator=(const LinkWorker&) = delete;

    bool start(std::string& error);
    void stop();
    bool isRunning() const;

    const std::string& name() const { return name_; }
    WorkerStats stats() const;

private:
    struct Context {
        std::atomic<bool> running{false};
        bool finished{false};
        std::mutex mutex;
        std::condition_variable done;
        WorkerCounters counters;
        Step step;
        int idle_sleep_us{1000};
        std::string name;
    };

    static void runLoop(std::shared_ptr<Context> ctx);

    std::string name_;
    WorkerConfig cfg_;
    Step step_;
    std::shared_ptr<Context> ctx_;
    std::thread thread_;
};

template <typename T>
class ProducerWorker : public LinkWorker {
public:
    using Source = std::function<std::optional<T>()>;

    ProducerWorker(std::string name, std::shared_ptr<BoundedQueue<T>> queue, Source source, const WorkerConfig& cfg)
        : LinkWorker(std::move(name), cfg, [queue, source](WorkerCounters& c) {
              std::optional<T> value = source();
              if (!value) {
                  return false;
              }
              c.items.fetch_add(1U, std::memory_order_relaxed);
              if (queue->tryPush(std::move(*value)) != PushResult::Ok) {
                  c.dropped.fetch_add(1U, std::memory_order_relaxed);
              }
              return true;
          }) {}
};

template <typename T>
class ConsumerWorker : public LinkWorker {
public:
    using Sink = std::function<void(T&)>;

    ConsumerWorker(std::string name, std::shared_ptr<BoundedQueue<T>> queue, Sink sink, const WorkerConfig& cfg)
        : LinkWorker(std::move(name), cfg, [queue, sink](WorkerCounters& c) {
              std::optional<T> item = queue->tryPop();
              if (!item) {
                  return false;
              }
              sink(*item);
              c.items.fetch_add(1U, std::memory_order_relaxed);
              return true;
          }) {}
};

}  // namespace durin::ipc
