/**
 * \file SendThrottle.hpp
 * \brief Serialized, rate-limited line writer.
 * \ingroup client_module
 * \details One send holds the slot at a time. After its write completes the
 * holder keeps the slot for the minimum interval, so consecutive writes are
 * separated by at least that much (completion of one to start of the next).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>

#include "logger.hpp"
#include "transport/coro/AsyncSlot.hpp"
#include "transport/coro/CoroTask.hpp"

namespace transport { class CoroSocketAdapter; }

namespace client {

class SendThrottle {
public:
    SendThrottle(std::shared_ptr<transport::CoroIoContext> ctx,
                 std::chrono::milliseconds min_interval,
                 std::shared_ptr<Logger> logger = nullptr);

    SendThrottle(const SendThrottle&) = delete;
    SendThrottle& operator=(const SendThrottle&) = delete;

    /** \brief Write `line` plus `\n` once the slot is free, then hold the slot for the interval.
     *  \details `done` is fulfilled when the send finishes: written and throttled, or dropped
     *  because `stop` was requested. A write failure on a live connection sets
     *  `transport::TransportFault` on `done` instead. The object must outlive the task.
     */
    Task<void> send(std::shared_ptr<transport::CoroSocketAdapter> stream,
                    std::string line,
                    std::stop_token stop,
                    std::promise<void> done);

    std::chrono::milliseconds min_interval() const noexcept { return min_interval_; }
    uint64_t lines_sent() const noexcept { return lines_sent_.load(std::memory_order_relaxed); }
    uint64_t bytes_sent() const noexcept { return bytes_sent_.load(std::memory_order_relaxed); }
    bool busy() const noexcept { return slot_.is_held(); }

private:
    std::shared_ptr<transport::CoroIoContext> context_;
    transport::AsyncSlot slot_;
    std::chrono::milliseconds min_interval_;
    std::shared_ptr<Logger> logger_;
    std::atomic<uint64_t> lines_sent_{0};
    std::atomic<uint64_t> bytes_sent_{0};
};

} // namespace client
