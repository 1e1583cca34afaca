#pragma once

/** \file index_applier.hpp
 *  \brief Single-worker FIFO queue applying committed writes to the indexes.
 *
 * Tasks run in submission order on one background thread. A failing task is logged and counted
 * and marks the owner as needing reconciliation; it never stops the queue.
 */

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <expected>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "tessera/error.hpp"

namespace tessera::collection {

class IndexApplier {
public:
    using Task = std::function<std::expected<void, core::error>()>;

    explicit IndexApplier(std::string name);
    ~IndexApplier();

    IndexApplier(const IndexApplier&) = delete;
    IndexApplier& operator=(const IndexApplier&) = delete;

    /** \brief Queue a task. Returns false once the applier is stopped. */
    auto submit(Task task) -> bool;

    /** \brief Block until every task submitted so far has run. */
    auto wait_idle() -> void;

    /** \brief Stop the worker. With drain the queue runs to completion first, otherwise
     *  queued tasks are discarded (and counted as pending work lost). Idempotent. */
    auto stop(bool drain) -> void;

    [[nodiscard]] auto pending() const noexcept -> std::size_t {
        return pending_.load(std::memory_order_acquire);
    }
    [[nodiscard]] auto failures() const noexcept -> std::size_t {
        return failures_.load(std::memory_order_relaxed);
    }
    [[nodiscard]] auto needs_reconcile() const noexcept -> bool {
        return needs_reconcile_.load(std::memory_order_acquire);
    }
    auto mark_needs_reconcile() noexcept -> void { needs_reconcile_.store(true, std::memory_order_release); }
    auto clear_needs_reconcile() noexcept -> void { needs_reconcile_.store(false, std::memory_order_release); }

    /** \brief Run a task inline with the same failure accounting as queued tasks. */
    auto run(const Task& task) -> std::expected<void, core::error>;

private:
    auto worker_loop() -> void;

    std::string name_;
    std::deque<Task> tasks_;
    mutable std::mutex queue_mutex_;
    std::condition_variable cv_;
    std::condition_variable idle_cv_;
    bool stop_{false};
    bool discard_{false};
    std::atomic<std::size_t> pending_{0};
    std::atomic<std::size_t> failures_{0};
    std::atomic<bool> needs_reconcile_{false};
    std::thread worker_;
};

} // namespace tessera::collection
