/**
 * \file BsdSocket.cpp
 * \brief Implementation of the POSIX TCP stream socket.
 * \ingroup socket_backend
 */
#include "BsdSocket.hpp"
#include "BsdErrnoCompat.hpp"
#include "transport/socket/HostResolver.hpp"
#include "logger.hpp"

#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#ifndef MSG_NOSIGNAL
#define MSG_NOSIGNAL 0
#endif

BsdSocket::BsdSocket() = default;

BsdSocket::BsdSocket(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

BsdSocket::~BsdSocket() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
        socket_fd_ = -1;
    }
}

std::shared_ptr<BsdSocket> BsdSocket::create(std::shared_ptr<Logger> logger) {
    return std::make_shared<BsdSocket>(std::move(logger));
}

bool BsdSocket::open_fd_if_needed(int family, std::error_code& error) {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (closed_.load(std::memory_order_acquire)) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return false;
    }
    if (socket_fd_ >= 0) return true;

    int fd = ::socket(family, SOCK_STREAM, 0);
    if (fd < 0) {
        error = BsdErrnoCompat::to_error_code(errno);
        return false;
    }
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0 || ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) < 0) {
        error = BsdErrnoCompat::to_error_code(errno);
        ::close(fd);
        return false;
    }
    ::fcntl(fd, F_SETFD, FD_CLOEXEC);
#ifdef SO_NOSIGPIPE
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_NOSIGPIPE, &one, sizeof(one));
#endif
    socket_fd_ = fd;
    return true;
}

void BsdSocket::connect(const std::string& host, int port, std::stop_token stop, std::error_code& error) {
    error.clear();
    if (port < 1 || port > 65535) {
        error = std::make_error_code(std::errc::invalid_argument);
        return;
    }
    if (is_connected_.load(std::memory_order_acquire)) {
        error = std::make_error_code(std::errc::already_connected);
        return;
    }

    auto endpoint = transport::resolve_endpoint(host, port, error);
    if (!endpoint) {
        if (logger_) logger_->warning("BsdSocket::connect: cannot resolve " + host + ": " + error.message());
        return;
    }
    if (stop.stop_requested()) {
        error = std::make_error_code(std::errc::operation_canceled);
        return;
    }

    if (!open_fd_if_needed(endpoint->family, error)) return;

    int fd = usable_fd();
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return;
    }

    int result = ::connect(fd, reinterpret_cast<const sockaddr*>(&endpoint->address), endpoint->length);
    if (result != 0) {
        int err = errno;
        if (!BsdErrnoCompat::is_connect_pending_errno(err)) {
            error = BsdErrnoCompat::to_error_code(err);
            if (logger_) {
                logger_->debug("BsdSocket::connect: " + host + ":" + std::to_string(port) +
                               " failed immediately (" + BsdErrnoCompat::errno_to_string(err) + ")");
            }
            return;
        }
        wait_for_connect(fd, stop, error);
        if (error) return;
    }

    is_connected_.store(true, std::memory_order_release);
    set_no_delay(true);
    update_endpoints();
    if (logger_) logger_->debug("BsdSocket connected " + local_endpoint() + " -> " + remote_endpoint());
}

void BsdSocket::wait_for_connect(int fd, std::stop_token& stop, std::error_code& error) {
    // Poll in short slices so a stop request or shutdown() is noticed promptly.
    while (true) {
        if (stop.stop_requested()) {
            error = std::make_error_code(std::errc::operation_canceled);
            return;
        }
        if (shutdown_requested_.load(std::memory_order_acquire) || closed_.load(std::memory_order_acquire)) {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            return;
        }

        pollfd pfd{};
        pfd.fd = fd;
        pfd.events = POLLOUT;
        int poll_result = ::poll(&pfd, 1, static_cast<int>(connect_poll_interval_.count()));
        if (poll_result < 0) {
            int err = errno;
            if (err == EINTR) continue;
            error = BsdErrnoCompat::to_error_code(err);
            return;
        }
        if (poll_result == 0) continue;

        int sock_err = 0;
        socklen_t len = sizeof(sock_err);
        if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &sock_err, &len) != 0) {
            error = BsdErrnoCompat::to_error_code(errno);
            return;
        }
        if (sock_err != 0) {
            error = BsdErrnoCompat::to_error_code(sock_err);
        }
        return;
    }
}

int BsdSocket::usable_fd() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (closed_.load(std::memory_order_acquire)) return -1;
    return socket_fd_;
}

bool BsdSocket::try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    bytes_read = 0;
    int fd = usable_fd();
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }

    ssize_t result = ::recv(fd, buffer, size, 0);
    if (result > 0) {
        bytes_read = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    if (result == 0) {
        // Orderly shutdown by the peer.
        error.clear();
        return true;
    }
    int err = errno;
    if (BsdErrnoCompat::is_would_block_errno(err)) {
        return false;
    }
    error = BsdErrnoCompat::to_error_code(err);
    return true;
}

bool BsdSocket::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    int fd = usable_fd();
    if (fd < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }

    ssize_t result = ::send(fd, buffer, size, MSG_NOSIGNAL);
    if (result >= 0) {
        bytes_written = static_cast<size_t>(result);
        error.clear();
        return true;
    }
    int err = errno;
    if (BsdErrnoCompat::is_would_block_errno(err)) {
        return false;
    }
    error = BsdErrnoCompat::to_error_code(err);
    return true;
}

void BsdSocket::close() noexcept {
    int fd = -1;
    {
        std::lock_guard<std::mutex> lock(socket_mtx_);
        if (closed_.exchange(true, std::memory_order_acq_rel)) return;
        fd = socket_fd_;
    }
    is_connected_.store(false, std::memory_order_release);
    if (fd >= 0) {
        // Wakes any peer-side reader; the descriptor itself is released by the destructor.
        ::shutdown(fd, SHUT_RDWR);
    }
}

void BsdSocket::shutdown() noexcept {
    shutdown_requested_.store(true, std::memory_order_release);
}

bool BsdSocket::is_open() const {
    return usable_fd() >= 0;
}

int BsdSocket::get_handle() const {
    return usable_fd();
}

std::string BsdSocket::remote_endpoint() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return remote_endpoint_;
}

std::string BsdSocket::local_endpoint() const {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    return local_endpoint_;
}

std::string BsdSocket::socket_type() const {
    return "bsd_socket";
}

bool BsdSocket::set_no_delay(bool enable) {
    int fd = usable_fd();
    if (fd < 0) return false;
    int flag = enable ? 1 : 0;
    if (::setsockopt(fd, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0) {
        return true;
    }
    if (logger_) {
        logger_->warning("Failed to set TCP_NODELAY on fd " + std::to_string(fd) + ": " +
                         BsdErrnoCompat::errno_to_string(errno));
    }
    return false;
}

void BsdSocket::update_endpoints() {
    std::lock_guard<std::mutex> lock(socket_mtx_);
    if (socket_fd_ < 0) return;
    sockaddr_storage addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        local_endpoint_ = transport::format_endpoint(addr);
    }
    addr = sockaddr_storage{};
    len = sizeof(addr);
    if (::getpeername(socket_fd_, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        remote_endpoint_ = transport::format_endpoint(addr);
    }
}
