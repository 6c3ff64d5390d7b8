#include "ipc/link_worker.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <system_error>

namespace durin::ipc {

LinkWorker::LinkWorker(std::string name, const WorkerConfig& cfg, Step step)
    : name_(std::move(name)), cfg_(cfg), step_(std::move(step)) {}

LinkWorker::~LinkWorker() {
    stop();
}

bool LinkWorker::start(std::string& error) {
    if (isRunning()) {
        error = name_ + ": worker already running";
        return false;
    }
    if (!step_) {
        error = name_ + ": worker has no step function";
        return false;
    }
    auto ctx = std::make_shared<Context>();
    ctx->step = step_;
    ctx->idle_sleep_us = cfg_.idle_sleep_us;
    ctx->name = name_;
    ctx->running.store(true, std::memory_order_release);
    try {
        thread_ = std::thread(&LinkWorker::runLoop, ctx);
    } catch (const std::system_error& e) {
        error = name_ + ": failed to spawn worker thread: " + e.what();
        return false;
    }
    ctx_ = std::move(ctx);
    error.clear();
    return true;
}

void LinkWorker::stop() {
    if (!ctx_ || !ctx_->running.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    bool exited = false;
    {
        std::unique_lock<std::mutex> lock(ctx_->mutex);
        exited = ctx_->done.wait_for(
            lock, std::chrono::milliseconds(cfg_.stop_timeout_ms), [this]() { return ctx_->finished; });
    }
    if (!thread_.joinable()) {
        return;
    }
    if (exited) {
        thread_.join();
    } else {
        std::cerr << "warning: " << name_ << " worker did not exit within "
                  << cfg_.stop_timeout_ms << " ms, detaching\n";
        thread_.detach();
    }
}

bool LinkWorker::isRunning() const {
    return ctx_ && ctx_->running.load(std::memory_order_acquire);
}

WorkerStats LinkWorker::stats() const {
    WorkerStats out{};
    if (!ctx_) {
        return out;
    }
    const auto& c = ctx_->counters;
    out.iterations = c.iterations.load(std::memory_order_relaxed);
    out.items = c.items.load(std::memory_order_relaxed);
    out.dropped = c.dropped.load(std::memory_order_relaxed);
    out.errors = c.errors.load(std::memory_order_relaxed);
    return out;
}

void LinkWorker::runLoop(std::shared_ptr<Context> ctx) {
    while (ctx->running.load(std::memory_order_acquire)) {
        ctx->counters.iterations.fetch_add(1U, std::memory_order_relaxed);
        bool busy = false;
        try {
            busy = ctx->step(ctx->counters);
        } catch (const std::exception& e) {
            ctx->counters.errors.fetch_add(1U, std::memory_order_relaxed);
            std::cerr << "[" << ctx->name << "] step failed: " << e.what() << "\n";
        } catch (...) {
            ctx->counters.errors.fetch_add(1U, std::memory_order_relaxed);
            std::cerr << "[" << ctx->name << "] step failed: unknown exception\n";
        }
        if (!busy) {
            std::this_thread::sleep_for(std::chrono::microseconds(ctx->idle_sleep_us));
        }
    }
    {
        std::lock_guard<std::mutex> lock(ctx->mutex);
        ctx->finished = true;
    }
    ctx->done.notify_all();
}

}  // namespace durin::ipc
