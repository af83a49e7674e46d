/**
 * \file BsdSocket.hpp
 * \brief POSIX TCP implementation of IAsyncStream.
 * \ingroup socket_backend
 * \details Non-blocking stream socket over the host TCP/IP stack. Connect is
 *  performed synchronously (poll-based, interruptible by a stop token or
 *  `shutdown()`); reads and writes are non-blocking attempts driven by the
 *  coroutine adapter.
 */
#pragma once

#include "transport/socket/IAsyncStream.hpp"
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <system_error>

class Logger;

/** \brief POSIX-backed client stream implementing the async role.
 *  \ingroup socket_backend
 *  \details `close()` shuts the connection down but keeps the descriptor
 *  reserved until destruction, so a `try_*` call racing with `close()` can never
 *  touch a descriptor number the process has reused for something else.
 */
class BsdSocket : public virtual IAsyncStream {
public:
    // === Construction & Lifecycle ===
    /** \brief Constructor for client sockets; the descriptor is created lazily by `connect()`. */
    BsdSocket();

    /** \brief Constructor with logger injection.
     *  \param logger Shared logger instance for diagnostics (optional).
     */
    explicit BsdSocket(std::shared_ptr<Logger> logger);

    /** \brief Destructor; releases the descriptor. */
    ~BsdSocket() override;

    BsdSocket(const BsdSocket&) = delete;
    BsdSocket& operator=(const BsdSocket&) = delete;

    // === Starting a client ===
    /** \brief Resolve `host` (IPv4) and connect, polling until done, cancelled or shut down.
     *  \param host Hostname or IPv4 literal.
     *  \param port Port number (1-65535).
     *  \param stop Cancellation; yields `operation_canceled` when requested.
     *  \param error Receives the failure; cleared on success.
     */
    void connect(const std::string& host, int port, std::stop_token stop, std::error_code& error) override;

    // === I/O operations ===
    /** \brief Attempt a non-blocking read.
     *  \param buffer Destination buffer.
     *  \param size Maximum bytes to read.
     *  \param bytes_read Out: bytes read; 0 with no error means the peer closed.
     *  \param error Receives error on completion; cleared on success or would-block.
     *  \return true if completed (data, end-of-stream or error); false if would block.
     */
    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;

    /** \brief Attempt a non-blocking write.
     *  \param buffer Source buffer.
     *  \param size Bytes to write.
     *  \param bytes_written Out: bytes written (may be less than `size`).
     *  \param error Receives error on completion; cleared on success or would-block.
     *  \return true if completed (success or error); false if would block.
     */
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;

    // === Closing / teardown ===
    /** \brief Shut down both directions; later operations fail with `bad_file_descriptor`. */
    void close() noexcept override;

    /** \brief Request shutdown - interrupts a connect that is still polling. */
    void shutdown() noexcept override;

    // === Status & information ===
    bool is_open() const override;
    int get_handle() const override;
    std::string remote_endpoint() const override;
    std::string local_endpoint() const override;
    /** \brief Implementation tag string ("bsd_socket"). */
    std::string socket_type() const override;

    /** \brief Enable or disable TCP_NODELAY (Nagle's algorithm).
     *  \return true on success, false on failure.
     */
    bool set_no_delay(bool enable);

    // === Factory helpers ===
    static std::shared_ptr<BsdSocket> create(std::shared_ptr<Logger> logger = nullptr);

private:
    /** \brief Create the descriptor for `family` (non-blocking, close-on-exec) if not done yet. */
    bool open_fd_if_needed(int family, std::error_code& error);
    /** \brief Poll a pending connect until it completes, is cancelled, or fails. */
    void wait_for_connect(int fd, std::stop_token& stop, std::error_code& error);
    /** \brief Update endpoint strings based on current socket state. */
    void update_endpoints();
    /** \brief Descriptor if the socket is usable for I/O, otherwise -1. */
    int usable_fd() const;

    static constexpr std::chrono::milliseconds connect_poll_interval_{50};

    int socket_fd_{-1};
    mutable std::mutex socket_mtx_;  // Protects socket_fd_ and endpoint strings
    std::atomic<bool> is_connected_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> shutdown_requested_{false};
    std::string local_endpoint_{};
    std::string remote_endpoint_{};

    std::shared_ptr<Logger> logger_{};
};
