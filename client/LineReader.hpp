/**
 * \file LineReader.hpp
 * \brief Background read loop delivering newline-delimited messages.
 * \ingroup client_module
 */
#pragma once

#include <array>
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>

#include "logger.hpp"
#include "LineDecoder.hpp"
#include "transport/coro/CoroTask.hpp"

namespace transport { class CoroSocketAdapter; }

namespace client {

/** \brief Hooks the read loop calls on an event-loop thread. */
struct LineReaderCallbacks {
    std::function<void(const std::string&)> on_line;
    /// Peer closed the stream (after any trailing partial line was delivered).
    std::function<void()> on_end_of_stream;
    /// Read failed while the connection was live; the loop ends with TransportFault afterwards.
    std::function<void(const std::error_code&)> on_fault;
};

/** \brief Reads from a connected stream until end-of-stream, fault or cancellation.
 *  \details The object must outlive the task returned by `run()`.
 *  Cancellation mid-read ends the loop quietly; no callback fires for it.
 */
class LineReader {
public:
    LineReader(std::shared_ptr<transport::CoroSocketAdapter> stream,
               std::stop_token stop,
               LineReaderCallbacks callbacks,
               std::shared_ptr<Logger> logger = nullptr);

    LineReader(const LineReader&) = delete;
    LineReader& operator=(const LineReader&) = delete;

    /** \brief The loop. Starts by hopping onto the stream's event loop.
     *  \throws transport::TransportFault (stored in the task) on a genuine read failure.
     */
    Task<void> run();

    uint64_t lines_received() const noexcept { return lines_received_.load(std::memory_order_relaxed); }
    uint64_t bytes_received() const noexcept { return bytes_received_.load(std::memory_order_relaxed); }

private:
    void deliver(const std::string& line);

    std::shared_ptr<transport::CoroSocketAdapter> stream_;
    std::stop_token stop_;
    LineReaderCallbacks callbacks_;
    std::shared_ptr<Logger> logger_;
    LineDecoder decoder_;
    std::array<char, 4096> buffer_{};
    std::atomic<uint64_t> lines_received_{0};
    std::atomic<uint64_t> bytes_received_{0};
};

} // namespace client
