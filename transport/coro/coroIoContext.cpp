/**
 * \file coroIoContext.cpp
 * \brief Operational implementation for `transport::CoroIoContext`.
 * \details Implements the worker thread loop and pending operation processing:
 * - Pending operations are stolen in batches (swap with local vector) to minimize lock contention.
 * - A short timed wait (`poll_interval_`) re-polls unfinished operations; registrations and
 *   `wake()` cut the wait short.
 */
#include "coroIoContext.hpp"
#include <coroutine>
#include <string>
#include "processUtils.hpp"

namespace transport {

CoroIoContext::CoroIoContext() = default;

CoroIoContext::~CoroIoContext() { stop(); }

void CoroIoContext::start() { start(1); }

void CoroIoContext::start(size_t threads) {
    if (threads == 0) threads = 1;
    bool expected = false;
    if (running_.compare_exchange_strong(expected, true)) {
        event_threads_.reserve(threads);
        for (size_t i = 0; i < threads; ++i) {
            // name each thread so it's easier to identify in debuggers / profilers
            event_threads_.emplace_back([this, i] {
                if (!ProcessUtils::set_current_thread_name("coro-io-" + std::to_string(i)) && logger_) {
                    logger_->debug("CoroIoContext: could not name worker thread " + std::to_string(i));
                }
                run_loop();
            });
        }
        if (logger_) logger_->debug("CoroIoContext started with " + std::to_string(threads) + " thread(s)");
    }
}

void CoroIoContext::stop() {
    if (running_.exchange(false)) {
        wake();
        const auto self = std::this_thread::get_id();
        for (auto& t : event_threads_) {
            if (!t.joinable()) continue;
            // The last owner may release the context from inside a resumed coroutine.
            if (t.get_id() == self) {
                t.detach();
            } else {
                t.join();
            }
        }
        event_threads_.clear();
        if (logger_) logger_->debug("CoroIoContext stopped");
    }
}

bool CoroIoContext::is_running() const { return running_; }

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> CoroIoContext::get_logger() const { return logger_; }

void CoroIoContext::run() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        if (logger_) logger_->warning("CoroIoContext::run called while already running");
        return;
    }
    run_loop();
}

void CoroIoContext::run_loop() {
    while (running_) {
        try {
            process_pending_ops();
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in event loop: " + std::string(e.what()));
        }
        // Timed wait: the flag prevents lost wakeups (work queued prior to sleep),
        // the timeout re-polls operations that were not ready.
        std::unique_lock<std::mutex> lk(pending_mutex_);
        pending_cv_.wait_for(lk, poll_interval_, [this]() {
            return !running_ || new_work_;
        });
    }
}

void CoroIoContext::process_pending_ops() {
    // Thread-local scratch buffers to minimize allocations & allocator churn.
    thread_local std::vector<PendingOp> fetched;
    thread_local std::vector<PendingOp> requeue; // unfinished

    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        new_work_ = false;
        if (pending_ops_.empty()) {
            return;
        }
        fetched.swap(pending_ops_); // pending_ops_ now empty
    }

    for (auto &op : fetched) {
        bool completed = false;
        try {
            completed = op.try_complete ? op.try_complete() : true;
        } catch (const std::exception &e) {
            // The awaiter reports its own failure on resume; the loop just drops the predicate.
            if (logger_) logger_->error(std::string("Error in try_complete: ") + e.what());
            completed = true;
        }
        if (completed) {
            auto h = op.handle;
            op.try_complete = nullptr;
            if (h && !h.done()) {
                h.resume();
                total_operations_processed_.fetch_add(1, std::memory_order_relaxed);
            }
        } else {
            requeue.push_back(std::move(op));
        }
    }

    fetched.clear(); // keep capacity

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (pending_ops_.capacity() < pending_ops_.size() + requeue.size()) {
            pending_ops_.reserve(pending_ops_.size() + requeue.size());
        }
        for (auto &op : requeue) {
            pending_ops_.push_back(std::move(op));
        }
        requeue.clear();
    }
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        PendingOp op{};
        op.try_complete = std::move(try_complete);
        op.handle = handle;
        pending_ops_.push_back(std::move(op));
        new_work_ = true;
    }
    pending_cv_.notify_one();
}

void CoroIoContext::wake() {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        new_work_ = true;
    }
    pending_cv_.notify_all();
}

size_t CoroIoContext::get_total_operations_processed() const {
    return total_operations_processed_.load(std::memory_order_relaxed);
}

size_t CoroIoContext::pending_operation_count() const {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    return pending_ops_.size();
}

} // namespace transport
