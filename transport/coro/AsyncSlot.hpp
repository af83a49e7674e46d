/**
 * \file AsyncSlot.hpp
 * \brief Single-holder gate for coroutines.
 * \details At most one coroutine holds the slot; others suspend on the owning
 * `CoroIoContext` until it is released or their stop token fires. Waiters are
 * not queued: whichever poll observes the free slot first takes it.
 */
#pragma once

#include <atomic>
#include <coroutine>
#include <memory>
#include <stop_token>
#include <utility>
#include "coroIoContext.hpp"

namespace transport {

/** \brief Coroutine-friendly binary semaphore.
 *  \ingroup coro_context
 */
class AsyncSlot {
public:
	explicit AsyncSlot(std::shared_ptr<CoroIoContext> ctx) : context_(std::move(ctx)) {}

	AsyncSlot(const AsyncSlot&) = delete;
	AsyncSlot& operator=(const AsyncSlot&) = delete;

	/** \brief Take the slot if it is free. */
	bool try_acquire() noexcept {
		bool expected = false;
		return held_.compare_exchange_strong(expected, true, std::memory_order_acq_rel);
	}

	/** \brief Give the slot back and let waiting coroutines re-poll. */
	void release() noexcept {
		held_.store(false, std::memory_order_release);
		if (context_) context_->wake();
	}

	/** \brief True while some coroutine holds the slot. */
	bool is_held() const noexcept { return held_.load(std::memory_order_acquire); }

	/** \brief Await the slot.
	 *  \return true when acquired; false when `stop` was requested first (slot not held).
	 */
	auto acquire(std::stop_token stop) {
		struct AcquireAwaitable {
			AsyncSlot* slot;
			std::stop_token stop;
			bool acquired{false};
			bool await_ready() {
				if (stop.stop_requested()) return true;
				acquired = slot->try_acquire();
				return acquired;
			}
			void await_suspend(std::coroutine_handle<> handle) {
				// The predicate records the outcome in `acquired` before the resume.
				slot->context_->register_pending([this] {
					if (stop.stop_requested()) return true;
					acquired = slot->try_acquire();
					return acquired;
				}, handle);
			}
			bool await_resume() const noexcept { return acquired; }
		};
		return AcquireAwaitable{this, std::move(stop)};
	}

	/** \brief RAII holder; releases on destruction unless already released. */
	class Guard {
	public:
		explicit Guard(AsyncSlot& slot) : slot_(&slot) {}
		~Guard() { release(); }
		Guard(const Guard&) = delete;
		Guard& operator=(const Guard&) = delete;
		void release() noexcept {
			if (slot_) {
				slot_->release();
				slot_ = nullptr;
			}
		}
	private:
		AsyncSlot* slot_;
	};

private:
	std::atomic<bool> held_{false};
	std::shared_ptr<CoroIoContext> context_;
};

} // namespace transport
