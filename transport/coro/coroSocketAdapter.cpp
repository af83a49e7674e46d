/**
 * \file coroSocketAdapter.cpp
 * \brief Implementation details for `transport::CoroSocketAdapter`.
 * \details Implements the connect() convenience method and the non-blocking progress
 * function polled by the event loop for every suspended transfer.
 */

#include "CoroSocketAdapter.hpp"
#include <system_error>

namespace transport {

void CoroSocketAdapter::connect(const std::string &host, int port, std::stop_token stop, std::error_code& error) {
    if (!socket_) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    socket_->connect(host, port, std::move(stop), error);
}

bool CoroSocketAdapter::try_complete(OperationState& op) {
    if (op.stop.stop_requested()) {
        op.error = std::make_error_code(std::errc::operation_canceled);
        return true;
    }
    if (!socket_) {
        op.error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }

    while (op.transferred < op.size) {
        size_t n = 0;
        bool completed = false;
        if (op.type == OperationType::READ) {
            auto* dst = static_cast<uint8_t*>(op.read_buffer) + op.transferred;
            completed = socket_->try_read(dst, op.size - op.transferred, n, op.error);
        } else {
            const auto* src = static_cast<const uint8_t*>(op.write_buffer) + op.transferred;
            completed = socket_->try_write(src, op.size - op.transferred, n, op.error);
        }
        if (!completed) return false;
        if (op.error) return true;
        if (n == 0) {
            if (op.type == OperationType::READ) {
                op.end_of_stream = true;
                return true;
            }
            // A zero-byte write with no error makes no progress; retry on the next poll.
            return false;
        }
        op.transferred += n;
        if (!op.fill) return true;
    }
    return true;
}

} // namespace transport
