/**
 * \file SendThrottle.cpp
 * \brief Send path: slot, write, interval, release.
 * \ingroup client_module
 */
#include "SendThrottle.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"

namespace client {

SendThrottle::SendThrottle(std::shared_ptr<transport::CoroIoContext> ctx,
                           std::chrono::milliseconds min_interval,
                           std::shared_ptr<Logger> logger)
    : context_(ctx),
      slot_(ctx),
      min_interval_(min_interval),
      logger_(std::move(logger)) {}

Task<void> SendThrottle::send(std::shared_ptr<transport::CoroSocketAdapter> stream,
                              std::string line,
                              std::stop_token stop,
                              std::promise<void> done) {
    if (!co_await slot_.acquire(stop)) {
        if (logger_) logger_->debug("Send dropped while waiting for the slot");
        done.set_value();
        co_return;
    }
    transport::AsyncSlot::Guard guard(slot_);

    if (stop.stop_requested()) {
        guard.release();
        done.set_value();
        co_return;
    }

    line.push_back('\n');
    std::error_code fault;
    try {
        co_await stream->async_write(line.data(), line.size(), stop);
    } catch (const std::system_error& e) {
        fault = e.code();
    }

    if (fault) {
        guard.release();
        if (stop.stop_requested()) {
            if (logger_) logger_->debug("Write interrupted by teardown (" + fault.message() + ")");
            done.set_value();
            co_return;
        }
        if (logger_) logger_->error("Write failed: " + fault.message());
        done.set_exception(std::make_exception_ptr(
            transport::TransportFault(fault, "write to " + stream->remote_endpoint() + " failed")));
        co_return;
    }

    lines_sent_.fetch_add(1, std::memory_order_relaxed);
    bytes_sent_.fetch_add(line.size(), std::memory_order_relaxed);

    if (min_interval_.count() > 0) {
        co_await context_->sleep_for(min_interval_, stop);
    }
    guard.release();
    done.set_value();
}

} // namespace client
