/**
 * \file coroIoContext.hpp
 * \brief Coroutine-aware I/O/event loop context.
 * \details Pending operations register non-blocking `try_complete()` functors.
 * Event threads poll and resume associated coroutine handles when ready. Uses
 * `notify_one()` wakeups with a short poll fallback; `wake()` lets a stop
 * request or a released resource trigger an immediate re-poll.
 */
// CoroIoContext.hpp: Coroutine-aware I/O/event loop context.
#pragma once

#include "logger.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>
#include <vector>

namespace transport {

/** \defgroup coro_context I/O Context
 *  \ingroup coro_module
 *  \brief Event-loop for coroutine scheduling and pending operation polling.
 */

/** \brief Coroutine-aware I/O/event loop context that polls pending operations and resumes coroutines.
 *  \details Registers non-blocking `try_complete()` functors and resumes the associated coroutine
 *  handle on readiness. Also provides `schedule()` (hop onto a loop thread) and `sleep_for()`
 *  (cancellable timer) awaitables.
 *  \ingroup coro_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	/** \brief Construct an event loop; call `start()` or `run()` to begin processing. */
	CoroIoContext();
	~CoroIoContext();

	CoroIoContext(const CoroIoContext&) = delete;
	CoroIoContext& operator=(const CoroIoContext&) = delete;

	// --- Lifecycle ---
	/** \brief Start the loop with one worker thread. */
	void start();
	/** \brief Start the loop with `threads` worker threads (minimum 1). */
	void start(size_t threads);
	/** \brief Run on current thread until `stop()` is called. */
	void run();
	/** \brief Request shutdown and join worker threads.
	 *  \details Coroutines still suspended on this context are not resumed afterwards;
	 *  owners must let their tasks finish first.
	 */
	void stop();
	/** \brief True if loop is running and not yet stopped. */
	bool is_running() const;

	// --- Logger ---
	/** \brief Set optional logger for info/error messages. */
	void set_logger(std::shared_ptr<Logger> logger);
	/** \brief Get the currently configured logger (may be null). */
	std::shared_ptr<Logger> get_logger() const;

	// --- Pending operations registration ---
	/** \brief Register a pending operation; resumes `handle` when predicate returns true.
	 *  \details The predicate runs on a loop thread. Once this call returns the coroutine may
	 *  already have been resumed, so callers must not touch the awaiter afterwards.
	 *  \see transport::CoroSocketAdapter::async_read_some
	 *  \see transport::CoroSocketAdapter::async_write
	 */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);

	/** \brief Force an immediate re-poll of every pending operation. Safe from any thread. */
	void wake();

	// --- Awaitables ---
	/** \brief Suspend and resume on one of this context's loop threads. */
	auto schedule() {
		struct ScheduleAwaitable {
			CoroIoContext* ctx;
			bool await_ready() const noexcept { return false; }
			void await_suspend(std::coroutine_handle<> handle) {
				ctx->register_pending([] { return true; }, handle);
			}
			void await_resume() const noexcept {}
		};
		return ScheduleAwaitable{this};
	}

	/** \brief Suspend for `duration` or until `stop` is requested.
	 *  \return true if the full duration elapsed; false if cancelled.
	 */
	auto sleep_for(std::chrono::milliseconds duration, std::stop_token stop) {
		struct SleepAwaitable {
			CoroIoContext* ctx;
			std::chrono::steady_clock::time_point deadline;
			std::stop_token stop;
			bool await_ready() const noexcept {
				return stop.stop_requested() || std::chrono::steady_clock::now() >= deadline;
			}
			void await_suspend(std::coroutine_handle<> handle) {
				ctx->register_pending([deadline = deadline, stop = stop] {
					return stop.stop_requested() || std::chrono::steady_clock::now() >= deadline;
				}, handle);
			}
			bool await_resume() const noexcept { return !stop.stop_requested(); }
		};
		return SleepAwaitable{this, std::chrono::steady_clock::now() + duration, std::move(stop)};
	}

	// --- Statistics ---
	/** \brief Total coroutine resumptions performed across all threads. */
	size_t get_total_operations_processed() const;
	/** \brief Number of operations currently waiting for readiness. */
	size_t pending_operation_count() const;

private:
	/** \brief Worker thread body. */
	void run_loop();
	/** \brief Process all currently pending operations; requeues unfinished. */
	void process_pending_ops();

	/** \brief Internal representation of a pending operation awaiting readiness. */
	struct PendingOp {
		std::function<bool()> try_complete;      ///< Readiness predicate/work attempt
		std::coroutine_handle<> handle;          ///< Coroutine to resume on success
	};
	std::vector<PendingOp> pending_ops_;
	mutable std::mutex pending_mutex_;
	std::condition_variable pending_cv_;
	/** \brief Set by registrations and `wake()`; cleared when a thread starts a polling pass. */
	bool new_work_{false};

	std::atomic<bool> running_{false};
	std::vector<std::thread> event_threads_;
	std::shared_ptr<Logger> logger_;
	/** \brief Maximum sleep interval before re-polling unfinished operations. */
	std::chrono::milliseconds poll_interval_{std::chrono::milliseconds(10)};

	std::atomic<size_t> total_operations_processed_{0};
};

namespace detail {
inline std::shared_ptr<CoroIoContext> get_default_context() {
	static std::weak_ptr<CoroIoContext> weak;
	static std::mutex m;
	std::lock_guard<std::mutex> lk(m);
	auto s = weak.lock();
	if (!s) {
		s = std::make_shared<CoroIoContext>();
		// One thread is enough for a handful of clients; callers wanting more supply their own context.
		s->start();
		weak = s;
	}
	return s;
}
}

/** \brief Process-wide shared loop, started on first use and stopped when the last user lets go. */
inline std::shared_ptr<CoroIoContext> default_loop() { return detail::get_default_context(); }

} // namespace transport
