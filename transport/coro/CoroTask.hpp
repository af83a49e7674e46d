/**
 * \file CoroTask.hpp
 * \brief Minimal C++20 coroutine task type used by the coro module.
 * \details Provides a lightweight Task<T> and Task<void> that own the coroutine
 * handle and define explicit suspend semantics: initial_suspend = suspend_never
 * to begin execution immediately and final_suspend parks the coroutine at
 * completion until the handle is destroyed.
 *
 * Exception policy: an exception escaping the coroutine body is captured in the
 * promise. `get_result()` / `rethrow_if_failed()` rethrow it and `exception()`
 * exposes it, so a background loop's fault stays observable by its owner.
 *
 * Completion is published through a shared latch, so another thread can block
 * in `wait()` and then destroy the Task safely.
 */
// CoroTask.hpp - Basic coroutine task type
#pragma once
#include <condition_variable>
#include <coroutine>
#include <exception>
#include <memory>
#include <mutex>
#include <utility>

/**
 * \defgroup coro_module Coroutine I/O Module
 * \brief Event loop, task types, and socket adapter for coroutine-based non-blocking I/O.
 * \details Provides the building blocks for coroutine-style networking: `Task<T>` wrappers,
 * `CoroIoContext` event loop, `AsyncSlot` gate, and `CoroSocketAdapter` awaitables over a
 * pluggable `IAsyncStream`.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Minimal coroutine task wrappers and semantics.
 */

/** \addtogroup coro_task
 *  @{ */

namespace coro_detail {

/** \brief One-shot completion flag shared by a promise and its Task. */
class CompletionLatch {
public:
    void set() {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            done_ = true;
        }
        cv_.notify_all();
    }
    void wait() {
        std::unique_lock<std::mutex> lk(mutex_);
        cv_.wait(lk, [this] { return done_; });
    }
    bool is_set() const {
        std::lock_guard<std::mutex> lk(mutex_);
        return done_;
    }
private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    bool done_{false};
};

/** \brief Promise state common to Task<T> and Task<void>. */
struct PromiseBase {
    std::shared_ptr<CompletionLatch> latch_{std::make_shared<CompletionLatch>()};
    std::exception_ptr exception_{};

    /// Final awaiter: signal the latch after the frame is suspended. Only the
    /// local latch copy is touched, because a waiter may destroy the frame as
    /// soon as it is signalled.
    struct FinalAwaiter {
        bool await_ready() const noexcept { return false; }
        template<typename Promise>
        void await_suspend(std::coroutine_handle<Promise> h) noexcept {
            auto latch = h.promise().latch_;
            latch->set();
        }
        void await_resume() const noexcept {}
    };

    /// Start executing immediately on creation
    std::suspend_never initial_suspend() noexcept { return {}; }
    /// Suspend at final suspend; lifetime controlled by Task owner
    FinalAwaiter final_suspend() noexcept { return {}; }
    /// Capture exceptions escaping the coroutine body
    void unhandled_exception() noexcept { exception_ = std::current_exception(); }
};

} // namespace coro_detail

/** \brief Simple coroutine task type for C++20 coroutines.
 *  \details Owns the coroutine handle; `initial_suspend = suspend_never` starts execution immediately.
 *  The frame stays alive after completion until the Task is destroyed. Destroying a Task whose
 *  coroutine is still suspended on an I/O operation is a bug; `wait()` first.
 *  \see transport::CoroIoContext \see transport::default_loop
 */
template<typename T = void>
struct Task {
    struct promise_type : coro_detail::PromiseBase {
        /// Returns a Task that owns the coroutine handle
        Task<T> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        /// Store the result value for retrieval via Task::get_result()
        void return_value(T value) {
            result_ = std::move(value);
        }

        T result_{};
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle), latch_(handle.promise().latch_) {}
    /// Destroys the coroutine if still present (destroys frame)
    ~Task() { if (h) h.destroy(); }
    /// Move constructible; transfers handle ownership
    Task(Task&& other) noexcept : h(other.h), latch_(std::move(other.latch_)) { other.h = nullptr; }
    /// Move assignable; destroys current handle then takes ownership
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            latch_ = std::move(other.latch_);
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True once the coroutine has reached final suspend
    bool done() const { return latch_ && latch_->is_set(); }
    /// Block the calling thread until the coroutine completes. Never call from the
    /// event-loop thread that has to resume it.
    void wait() const { if (latch_) latch_->wait(); }
    /// Exception that escaped the coroutine body (null if none or not finished)
    std::exception_ptr exception() const { return done() ? h.promise().exception_ : nullptr; }
    /// Rethrow the captured exception, if any
    void rethrow_if_failed() const {
        if (auto ep = exception()) std::rethrow_exception(ep);
    }

    /// Retrieve the result produced by the coroutine body (rethrows a captured exception)
    T get_result() {
        rethrow_if_failed();
        return std::move(h.promise().result_);
    }

private:
    std::shared_ptr<coro_detail::CompletionLatch> latch_;
};

/** \brief Specialization for `Task<void>` implementing the same lifetime semantics. */
template<>
struct Task<void> {
    struct promise_type : coro_detail::PromiseBase {
        /// Returns a Task<void> that owns the coroutine handle
        Task<void> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }

        /// No result to return for void
        void return_void() {}
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle), latch_(handle.promise().latch_) {}
    /// Destroys the coroutine if still present (destroys frame)
    ~Task() { if (h) h.destroy(); }
    /// Move constructible; transfers handle ownership
    Task(Task&& other) noexcept : h(other.h), latch_(std::move(other.latch_)) { other.h = nullptr; }
    /// Move assignable; destroys current handle then takes ownership
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            latch_ = std::move(other.latch_);
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True once the coroutine has reached final suspend
    bool done() const { return latch_ && latch_->is_set(); }
    /// Block the calling thread until the coroutine completes
    void wait() const { if (latch_) latch_->wait(); }
    /// Exception that escaped the coroutine body (null if none or not finished)
    std::exception_ptr exception() const { return done() ? h.promise().exception_ : nullptr; }
    /// Rethrow the captured exception, if any
    void rethrow_if_failed() const {
        if (auto ep = exception()) std::rethrow_exception(ep);
    }

private:
    std::shared_ptr<coro_detail::CompletionLatch> latch_;
};

/** @} */
