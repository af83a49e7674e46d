/**
 * \file LineReader.cpp
 * \brief Read loop implementation.
 * \ingroup client_module
 */
#include "LineReader.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"

#include <vector>

namespace client {

LineReader::LineReader(std::shared_ptr<transport::CoroSocketAdapter> stream,
                       std::stop_token stop,
                       LineReaderCallbacks callbacks,
                       std::shared_ptr<Logger> logger)
    : stream_(std::move(stream)),
      stop_(std::move(stop)),
      callbacks_(std::move(callbacks)),
      logger_(std::move(logger)) {}

void LineReader::deliver(const std::string& line) {
    lines_received_.fetch_add(1, std::memory_order_relaxed);
    if (callbacks_.on_line) callbacks_.on_line(line);
}

Task<void> LineReader::run() {
    co_await stream_->context()->schedule();

    std::vector<std::string> lines;
    std::error_code fault;
    while (!stop_.stop_requested()) {
        size_t n = 0;
        try {
            n = co_await stream_->async_read_some(buffer_.data(), buffer_.size(), stop_);
        } catch (const std::system_error& e) {
            fault = e.code();
        }

        if (fault) {
            // Classified by the scope state at the time of the fault, not by the error value.
            if (stop_.stop_requested()) {
                if (logger_) logger_->debug("Read loop stopped during teardown (" + fault.message() + ")");
                co_return;
            }
            if (logger_) logger_->error("Read loop fault: " + fault.message());
            if (callbacks_.on_fault) callbacks_.on_fault(fault);
            throw transport::TransportFault(fault, "read from " + stream_->remote_endpoint() + " failed");
        }

        if (n == 0) {
            std::string rest;
            if (decoder_.flush(rest) && !stop_.stop_requested()) {
                deliver(rest);
            }
            if (logger_) logger_->debug("Read loop reached end of stream");
            if (callbacks_.on_end_of_stream) callbacks_.on_end_of_stream();
            co_return;
        }

        bytes_received_.fetch_add(n, std::memory_order_relaxed);
        lines.clear();
        decoder_.feed(buffer_.data(), n, lines);
        for (const auto& line : lines) {
            if (stop_.stop_requested()) break;
            deliver(line);
        }
    }
    if (logger_) logger_->debug("Read loop cancelled");
}

} // namespace client
