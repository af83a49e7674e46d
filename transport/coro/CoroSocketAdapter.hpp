/**
 * \file CoroSocketAdapter.hpp
 * \brief A lightweight wrapper that adds C++20 coroutine awaitable operations to IAsyncStream.
 * \details Wraps an IAsyncStream and provides cancellable awaitable read/write operations,
 * resuming coroutines on event-loop threads. Does not inherit from IAsyncStream - uses
 * composition to add coroutine capability while delegating base operations.
 */
#pragma once

#include "logger.hpp"
#include <coroutine>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <system_error>
#include "coroIoContext.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "transport/socket/IAsyncStream.hpp"


namespace transport {

/** \defgroup coro_adapter Socket Adapter
 *  \ingroup coro_module
 *  \brief Awaitable socket operations wrapping IAsyncStream.
 */

/**
 * \brief Coroutine-aware wrapper adding awaitable operations to `IAsyncStream`.
 * \details
 * - Wraps an IAsyncStream and adds coroutine awaitable methods
 * - Fast-path: attempts non-blocking `try_*` completion in `await_ready()` to avoid suspension
 * - Slow-path: unfinished operations registered with `CoroIoContext` and resumed when ready
 * - Every operation takes a `std::stop_token`; a stop request completes it with
 *   `std::errc::operation_canceled` at the next poll
 * - Threading: continuations always resume on an event-loop thread
 * - \invariant At most one in-flight read and one in-flight write per adapter instance
 * \ingroup coro_adapter
 * \see transport::CoroIoContext \see IAsyncStream
 */
class CoroSocketAdapter : public std::enable_shared_from_this<CoroSocketAdapter> {
public:
    /** \brief Transfer direction of an operation. */
    enum class OperationType { READ, WRITE };

    /** \brief Progress of a single awaitable operation, shared with the loop's predicate.
     *  \details `fill` selects whether the operation keeps going until `size` bytes moved
     *  (or end-of-stream for reads) or completes on the first transfer.
     */
    struct OperationState {
        OperationType type{OperationType::READ};
        void* read_buffer{nullptr};
        const void* write_buffer{nullptr};
        size_t size{0};
        size_t transferred{0};
        bool fill{false};
        bool end_of_stream{false};
        std::error_code error{};
        std::stop_token stop{};
    };

    // Constructors
    explicit CoroSocketAdapter(std::shared_ptr<IAsyncStream> socket)
        : socket_(std::move(socket)), logger_(nullptr) {}

    CoroSocketAdapter(std::shared_ptr<IAsyncStream> socket, std::shared_ptr<Logger> logger)
        : socket_(std::move(socket)), logger_(std::move(logger)) {}

    CoroSocketAdapter(std::shared_ptr<IAsyncStream> socket, std::shared_ptr<Logger> logger, std::shared_ptr<CoroIoContext> ctx)
        : socket_(std::move(socket)), logger_(std::move(logger)), context_(std::move(ctx)) {}

    // Factories
    /** \brief Create a client adapter using the `SocketFactory` backend. */
    static std::shared_ptr<CoroSocketAdapter> create_client(std::shared_ptr<Logger> logger, std::shared_ptr<CoroIoContext> ctx = nullptr) {
        auto stream = SocketFactory::create_async_client(logger);
        return std::make_shared<CoroSocketAdapter>(stream, logger, ctx);
    }

    // Access to underlying socket for base operations
    /** \brief Get the underlying socket pointer for direct access to base operations. */
    IAsyncStream* socket() { return socket_.get(); }
    const IAsyncStream* socket() const { return socket_.get(); }
    /** \brief Event loop used for suspended operations (resolved on first use). */
    std::shared_ptr<CoroIoContext> context() {
        if (!context_) context_ = transport::default_loop();
        return context_;
    }

    // Convenience forwarding for common operations
    /** \brief Connect to a remote host/port (blocking, interruptible through `stop`). */
    void connect(const std::string &host, int port, std::stop_token stop, std::error_code& error);
    /** \brief Close the socket. */
    void close() noexcept { if (socket_) socket_->close(); }
    /** \brief Request shutdown - interrupts a blocking connect in the underlying socket. */
    void shutdown() noexcept { if (socket_) socket_->shutdown(); }
    /** \brief Check if socket is open. */
    bool is_open() const { return socket_ && socket_->is_open(); }
    /** \brief Get remote endpoint. */
    std::string remote_endpoint() const { return socket_ ? socket_->remote_endpoint() : ""; }
    /** \brief Get local endpoint. */
    std::string local_endpoint() const { return socket_ ? socket_->local_endpoint() : ""; }

    // Async IO operations (coroutine awaitable extensions)
    /** \brief Read whatever is available, up to `size` bytes.
     *  \return Bytes read; 0 means the peer closed the stream.
     *  \throws std::system_error on transport failure or cancellation.
     */
    auto async_read_some(void* buffer, size_t size, std::stop_token stop) {
        auto op = std::make_shared<OperationState>();
        op->type = OperationType::READ;
        op->read_buffer = buffer;
        op->size = size;
        op->stop = std::move(stop);
        return OperationAwaitable{shared_from_this(), std::move(op), "Async read operation failed"};
    }
    /** \brief Read exactly `size` bytes unless the stream ends first.
     *  \return Bytes read; less than `size` only when the peer closed the stream.
     *  \throws std::system_error on transport failure or cancellation.
     */
    auto async_read_exact(void* buffer, size_t size, std::stop_token stop) {
        auto op = std::make_shared<OperationState>();
        op->type = OperationType::READ;
        op->read_buffer = buffer;
        op->size = size;
        op->fill = true;
        op->stop = std::move(stop);
        return OperationAwaitable{shared_from_this(), std::move(op), "Async read operation failed"};
    }
    /** \brief Write all `size` bytes from `buffer`, resuming after partial writes.
     *  \return Bytes written (always `size` on success).
     *  \throws std::system_error on transport failure or cancellation.
     */
    auto async_write(const void* buffer, size_t size, std::stop_token stop) {
        auto op = std::make_shared<OperationState>();
        op->type = OperationType::WRITE;
        op->write_buffer = buffer;
        op->size = size;
        op->fill = true;
        op->stop = std::move(stop);
        return OperationAwaitable{shared_from_this(), std::move(op), "Async write operation failed"};
    }

    /** \brief Advance `op` by non-blocking attempts; true when finished (success, end-of-stream or error). */
    bool try_complete(OperationState& op);

private:
    /** \brief Awaitable shared by all transfer operations. */
    struct OperationAwaitable {
        std::shared_ptr<CoroSocketAdapter> socket;
        std::shared_ptr<OperationState> op;
        const char* what;

        bool await_ready() const {
            return socket->try_complete(*op);
        }
        void await_suspend(std::coroutine_handle<> handle) {
            // Copies only: the coroutine may resume before register_pending returns.
            auto ctx = socket->context();
            ctx->register_pending([s = socket, o = op]() {
                return s->try_complete(*o);
            }, handle);
        }
        size_t await_resume() const {
            if (op->error) {
                throw std::system_error(op->error, what);
            }
            return op->transferred;
        }
    };

    /** \brief Underlying asynchronous stream implementation (transport-specific). */
    std::shared_ptr<IAsyncStream> socket_;
    /** \brief Logger instance for diagnostics. */
    std::shared_ptr<Logger> logger_;
    /** \brief Associated coroutine I/O context (event loop); defaults to `transport::default_loop()` when first used. */
    std::shared_ptr<CoroIoContext> context_{};
};

} // namespace transport
