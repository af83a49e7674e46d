/**
 * \file LineClient.hpp
 * \brief Line-protocol TCP client: connect (direct or SOCKS4), read loop, throttled sends.
 * \ingroup client_module
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include "logger.hpp"
#include "ILineClientObserver.hpp"
#include "LineReader.hpp"
#include "SendThrottle.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/coroIoContext.hpp"

namespace transport { class CoroSocketAdapter; }

/** \defgroup client_module Line Client
 *  \brief Line-oriented client over TCP with optional SOCKS4 proxying.
 */

namespace client {

/** \brief Lifecycle of a LineClient. `Disconnected` is terminal. */
enum class ConnectionState { Unconnected, Connecting, Connected, Disconnected };

const char* to_string(ConnectionState state);

/** \brief Construction parameters; fixed for the client's lifetime. */
struct LineClientConfig {
    std::string host;
    int port{0};
    /// Minimum gap between the end of one write and the start of the next.
    std::chrono::milliseconds min_send_interval{0};
    /// Caller-side cancellation; a stop request disconnects the client.
    std::stop_token cancellation{};
};

/** \brief SOCKS4 proxy to tunnel through. */
struct ProxyEndpoint {
    std::string host;
    int port{0};
    std::string user_id;
};

/** \brief Traffic counters. */
struct LineClientStats {
    uint64_t lines_sent{0};
    uint64_t bytes_sent{0};
    uint64_t lines_received{0};
    uint64_t bytes_received{0};
};

/** \brief Line-protocol client.
 *  \ingroup client_module
 *  \details
 *  - `connect()` blocks the calling thread until the connection (and proxy handshake)
 *    is established, then starts the read loop on the event loop. Never call it from
 *    an event-loop thread.
 *  - `send()` is serialized and throttled; it returns a future that completes once the
 *    line was written and the interval elapsed, or once the send was dropped by teardown.
 *  - `disconnect()` is idempotent and emits exactly one `on_connection_closed()`.
 *  - The destructor disconnects and waits for the read loop and outstanding sends,
 *    so it must not run on an event-loop thread.
 */
class LineClient {
public:
    /** \throws std::invalid_argument for an empty host, a port outside 1-65535 or a negative interval. */
    explicit LineClient(LineClientConfig config,
                        std::shared_ptr<Logger> logger = nullptr,
                        std::shared_ptr<transport::CoroIoContext> ctx = nullptr);
    ~LineClient();

    LineClient(const LineClient&) = delete;
    LineClient& operator=(const LineClient&) = delete;

    /** \brief Open a direct TCP connection to an IPv4 or IPv6 address (first resolver result).
     *  \throws std::logic_error if connect was already attempted or the connection was closed.
     *  \throws transport::ConnectionError on resolution/TCP failure, or cancellation before or during the attempt.
     */
    void connect();

    /** \brief Connect through a SOCKS4 proxy. The target host must resolve to IPv4.
     *  \throws std::logic_error if connect was already attempted or the connection was closed.
     *  \throws std::invalid_argument for a bad proxy port or a user id with NUL bytes.
     *  \throws transport::ConnectionError on resolution/TCP failure, early close or cancellation.
     *  \throws transport::ProxyError if the proxy refuses.
     */
    void connect(const ProxyEndpoint& proxy);

    /** \brief Queue one line for sending.
     *  \details An empty message resolves immediately without writing. After disconnect
     *  the send resolves as dropped.
     *  \throws std::invalid_argument if `message` contains `\n`.
     *  \throws std::logic_error before the client is connected.
     */
    std::future<void> send(std::string message);
    /** \brief As above; an absent message is a no-op. */
    std::future<void> send(std::optional<std::string> message);
    /** \brief As above; a null pointer is a no-op. */
    std::future<void> send(const char* message);

    /** \brief Tear down the connection. Safe to call repeatedly, from any state and thread. */
    void disconnect() noexcept;
    /** \brief Disconnect once; later calls do nothing. */
    void dispose() noexcept;

    void subscribe(std::shared_ptr<ILineClientObserver> observer);
    void unsubscribe(const std::shared_ptr<ILineClientObserver>& observer);

    ConnectionState state() const;
    LineClientStats stats() const;
    std::string remote_endpoint() const;
    /** \brief Exception the read loop ended with, if it ended on a genuine fault. */
    std::exception_ptr read_loop_fault() const;
    const LineClientConfig& config() const noexcept { return config_; }

private:
    void begin_connect();
    void abort_connect() noexcept;
    void complete_connect(std::shared_ptr<transport::CoroSocketAdapter> stream, const std::string& via);
    void teardown(const std::string& reason) noexcept;
    void notify_message(const std::string& message);
    void notify_closed() noexcept;
    void reap_finished_sends();

    LineClientConfig config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<transport::CoroIoContext> context_;
    std::stop_source scope_;

    mutable std::mutex mutex_;  // Protects state_, stream_, reader_, read_task_
    ConnectionState state_{ConnectionState::Unconnected};
    /// State the client was in when teardown ran.
    ConnectionState closed_from_{ConnectionState::Unconnected};
    std::shared_ptr<transport::CoroSocketAdapter> stream_;
    std::unique_ptr<LineReader> reader_;
    std::unique_ptr<Task<void>> read_task_;

    SendThrottle throttle_;
    std::mutex sends_mutex_;
    std::vector<std::unique_ptr<Task<void>>> pending_sends_;

    mutable std::mutex observers_mutex_;
    std::vector<std::shared_ptr<ILineClientObserver>> observers_;

    std::atomic<bool> closed_{false};
    std::atomic<bool> disposed_{false};

    // Last member: its callback may run from the constructor and touches everything above.
    std::optional<std::stop_callback<std::function<void()>>> external_link_;
};

} // namespace client
