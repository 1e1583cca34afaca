#include "tessera/collection/index_applier.hpp"

#include <exception>

#include <spdlog/spdlog.h>

namespace tessera::collection {

IndexApplier::IndexApplier(std::string name) : name_(std::move(name)) {
    worker_ = std::thread([this] { worker_loop(); });
}

IndexApplier::~IndexApplier() { stop(true); }

auto IndexApplier::submit(Task task) -> bool {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return false;
        pending_.fetch_add(1, std::memory_order_acq_rel);
        tasks_.push_back(std::move(task));
    }
    cv_.notify_one();
    return true;
}

auto IndexApplier::wait_idle() -> void {
    std::unique_lock<std::mutex> lock(queue_mutex_);
    idle_cv_.wait(lock, [this] { return pending_.load(std::memory_order_acquire) == 0; });
}

auto IndexApplier::stop(bool drain) -> void {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (!stop_) {
            stop_ = true;
            discard_ = !drain;
        }
    }
    cv_.notify_all();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

auto IndexApplier::run(const Task& task) -> std::expected<void, core::error> {
    std::expected<void, core::error> result;
    try {
        result = task();
    } catch (const std::exception& e) {
        result = core::fail(core::error_code::internal, e.what(), "collection.applier");
    }
    if (!result) {
        failures_.fetch_add(1, std::memory_order_relaxed);
        needs_reconcile_.store(true, std::memory_order_release);
        spdlog::error("[{}] index update failed: {}", name_, core::describe(result.error()));
    }
    return result;
}

auto IndexApplier::worker_loop() -> void {
    for (;;) {
        Task task;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            cv_.wait(lock, [this] { return stop_ || !tasks_.empty(); });
            if (stop_ && (tasks_.empty() || discard_)) {
                if (!tasks_.empty()) {
                    spdlog::warn("[{}] discarding {} queued index updates", name_, tasks_.size());
                    tasks_.clear();
                }
                pending_.store(0, std::memory_order_release);
                idle_cv_.notify_all();
                return;
            }
            task = std::move(tasks_.front());
            tasks_.pop_front();
        }

        // Failures are accounted inside run(); the queue keeps going.
        (void)run(task);

        if (pending_.fetch_sub(1, std::memory_order_acq_rel) == 1) {
            std::lock_guard<std::mutex> lock(queue_mutex_);
            idle_cv_.notify_all();
        }
    }
}

} // namespace tessera::collection
