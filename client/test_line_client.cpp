/**
 * @file test_line_client.cpp
 * @brief End-to-end tests of LineClient against loopback peers.
 *
 * Covers direct and SOCKS4 connects, line delivery, the throttled send path,
 * and the teardown rules (one closed notification, quiet cancellation).
 */

#include "LineClient.hpp"
#include "test_loopback.hpp"
#include "transport/TransportErrors.hpp"

#include <algorithm>
#include <cassert>
#include <chrono>
#include <future>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

using namespace std::chrono_literals;
using client::ConnectionState;
using client::LineClient;
using client::LineClientConfig;
using test_support::LoopbackListener;
using test_support::RecordingObserver;
using test_support::ScriptedSocks4Proxy;

namespace {

std::shared_ptr<Logger> make_logger() {
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<StderrSink>();
    sink->set_level(LogLevel::Warning);
    logger->add_sink(sink);
    return logger;
}

LineClientConfig loopback_config(int port, std::chrono::milliseconds interval = 0ms) {
    LineClientConfig config;
    config.host = "127.0.0.1";
    config.port = port;
    config.min_send_interval = interval;
    return config;
}

bool is_ready(std::future<void>& f, std::chrono::milliseconds wait = 0ms) {
    return f.wait_for(wait) == std::future_status::ready;
}

/**
 * @brief Peer sends one line and closes: one message, then one closed notification.
 */
void test_receive_then_peer_close() {
    std::cout << "\n=== Testing Receive Then Peer Close ===\n";

    LoopbackListener listener;
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(listener.port()), make_logger());
    client.subscribe(observer);

    assert(client.state() == ConnectionState::Unconnected);
    client.connect();
    assert(client.state() == ConnectionState::Connected);
    assert(client.remote_endpoint() == "127.0.0.1:" + std::to_string(listener.port()));

    auto peer = listener.accept();
    assert(peer.valid());
    peer.send_raw("hello\n");
    peer.close();

    assert(observer->wait_for_closed());
    auto messages = observer->messages();
    assert(messages.size() == 1);
    assert(messages[0] == "hello");
    assert(observer->closed_count() == 1);
    assert(client.state() == ConnectionState::Disconnected);
    assert(client.read_loop_fault() == nullptr);

    auto stats = client.stats();
    assert(stats.lines_received == 1);
    assert(stats.bytes_received == 6);
    std::cout << "  Receive/peer-close test passed!\n";
}

/**
 * @brief CRLF terminators are stripped and an unterminated tail is delivered at EOF.
 */
void test_crlf_and_trailing_partial_line() {
    std::cout << "\n=== Testing CRLF And Trailing Partial Line ===\n";

    LoopbackListener listener;
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(listener.port()), make_logger());
    client.subscribe(observer);
    client.connect();

    auto peer = listener.accept();
    peer.send_raw("one\r\ntw");
    std::this_thread::sleep_for(20ms);
    peer.send_raw("o\nthree");
    peer.close();

    assert(observer->wait_for_closed());
    auto messages = observer->messages();
    assert(messages.size() == 3);
    assert(messages[0] == "one");
    assert(messages[1] == "two");
    assert(messages[2] == "three");
    assert(observer->closed_count() == 1);
    std::cout << "  CRLF/partial line test passed!\n";
}

/**
 * @brief Connecting to a port nobody listens on fails with ConnectionError.
 */
void test_connect_refused() {
    std::cout << "\n=== Testing Connect Refused ===\n";

    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(test_support::unused_port()), make_logger());
    client.subscribe(observer);

    bool threw = false;
    try {
        client.connect();
    } catch (const transport::ConnectionError& e) {
        threw = true;
        std::cout << "  ConnectionError: " << e.what() << "\n";
        assert(e.code() == std::errc::connection_refused);
    }
    assert(threw);
    assert(client.state() == ConnectionState::Unconnected);
    assert(observer->closed_count() == 0);
    assert(client.read_loop_fault() == nullptr);
    std::cout << "  Connect refused test passed!\n";
}

/**
 * @brief Construction and connect reject invalid arguments and illegal states.
 */
void test_argument_and_state_checks() {
    std::cout << "\n=== Testing Argument And State Checks ===\n";

    bool threw = false;
    try {
        LineClient bad(loopback_config(0));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        LineClient bad(loopback_config(65536));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    LoopbackListener listener;
    LineClient client(loopback_config(listener.port()), make_logger());

    threw = false;
    try {
        client.send("too early");
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);

    client.connect();
    threw = false;
    try {
        client.connect();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    assert(client.state() == ConnectionState::Connected);

    threw = false;
    try {
        client.send("two\nlines");
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);

    // A closed connection cannot be reopened
    client.disconnect();
    threw = false;
    try {
        client.connect();
    } catch (const transport::ConnectionError&) {
        assert(false);
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  Argument/state check test passed!\n";
}

/**
 * @brief Three concurrent sends reach the wire whole, one at a time, spaced by the interval.
 */
void test_sends_are_serialized_and_throttled() {
    std::cout << "\n=== Testing Serialized Throttled Sends ===\n";

    const auto interval = 150ms;
    LoopbackListener listener;
    LineClient client(loopback_config(listener.port(), interval), make_logger());
    client.connect();
    auto peer = listener.accept();

    std::vector<std::future<void>> sends;
    sends.push_back(client.send("A"));
    sends.push_back(client.send("B"));
    sends.push_back(client.send("C"));

    auto lines = peer.read_lines(3, 3000ms);
    assert(lines.size() == 3);
    assert(lines[0].text == "A");
    std::vector<std::string> texts{lines[0].text, lines[1].text, lines[2].text};
    std::sort(texts.begin(), texts.end());
    assert((texts == std::vector<std::string>{"A", "B", "C"}));
    for (size_t i = 1; i < lines.size(); ++i) {
        auto gap = std::chrono::duration_cast<std::chrono::milliseconds>(lines[i].at - lines[i - 1].at);
        std::cout << "  gap " << i << ": " << gap.count() << " ms\n";
        assert(gap >= interval - 20ms);
    }

    for (auto& f : sends) {
        assert(is_ready(f, 2000ms));
        f.get();
    }
    auto stats = client.stats();
    assert(stats.lines_sent == 3);
    assert(stats.bytes_sent == 6);
    std::cout << "  Serialized/throttled send test passed!\n";
}

/**
 * @brief Empty and absent messages resolve at once without writing, even while the slot is held.
 */
void test_empty_send_is_noop() {
    std::cout << "\n=== Testing Empty Send Is A No-op ===\n";

    LoopbackListener listener;
    LineClient client(loopback_config(listener.port(), 400ms), make_logger());
    client.connect();
    auto peer = listener.accept();

    auto first = client.send("first");
    auto empty = client.send(std::string());
    auto absent = client.send(std::optional<std::string>());
    auto null_text = client.send(static_cast<const char*>(nullptr));
    assert(is_ready(empty));
    assert(is_ready(absent));
    assert(is_ready(null_text));
    empty.get();
    assert(!is_ready(first));

    auto lines = peer.read_lines(2, 300ms);
    assert(lines.size() == 1);
    assert(lines[0].text == "first");
    assert(is_ready(first, 2000ms));
    assert(client.stats().lines_sent == 1);
    std::cout << "  Empty send test passed!\n";
}

/**
 * @brief Disconnect twice and dispose: exactly one closed notification, nothing thrown.
 */
void test_disconnect_is_idempotent() {
    std::cout << "\n=== Testing Idempotent Disconnect ===\n";

    LoopbackListener listener;
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(listener.port()), make_logger());
    client.subscribe(observer);
    client.connect();
    auto peer = listener.accept();

    client.disconnect();
    client.disconnect();
    client.dispose();
    client.dispose();

    assert(observer->closed_count() == 1);
    assert(client.state() == ConnectionState::Disconnected);

    // Peer sees the connection end.
    auto lines = peer.read_lines(1, 1000ms);
    assert(lines.empty());

    auto late = client.send("late");
    assert(is_ready(late));
    late.get();

    bool threw = false;
    try {
        client.connect();
    } catch (const std::logic_error&) {
        threw = true;
    }
    assert(threw);
    std::this_thread::sleep_for(50ms);
    assert(observer->closed_count() == 1);
    assert(client.read_loop_fault() == nullptr);
    std::cout << "  Idempotent disconnect test passed!\n";
}

/**
 * @brief Disconnect before any connect still fires the closed notification once.
 */
void test_disconnect_before_connect() {
    std::cout << "\n=== Testing Disconnect Before Connect ===\n";

    auto observer = std::make_shared<RecordingObserver>();
    {
        LineClient client(loopback_config(test_support::unused_port()), make_logger());
        client.subscribe(observer);
        client.disconnect();
        assert(client.state() == ConnectionState::Disconnected);
        assert(observer->closed_count() == 1);
    }
    assert(observer->closed_count() == 1);
    std::cout << "  Disconnect-before-connect test passed!\n";
}

/**
 * @brief A send waiting for the slot is dropped, not failed, when the client disconnects.
 */
void test_blocked_send_released_by_disconnect() {
    std::cout << "\n=== Testing Blocked Send Released By Disconnect ===\n";

    LoopbackListener listener;
    LineClient client(loopback_config(listener.port(), 5000ms), make_logger());
    client.connect();
    auto peer = listener.accept();

    auto holder = client.send("holder");
    auto waiter = client.send("waiter");
    auto first = peer.read_lines(1, 1000ms);
    assert(first.size() == 1 && first[0].text == "holder");
    assert(!is_ready(waiter, 100ms));

    auto started = test_support::Clock::now();
    client.disconnect();
    assert(is_ready(waiter, 1000ms));
    assert(is_ready(holder, 1000ms));
    waiter.get();
    holder.get();
    assert(test_support::Clock::now() - started < 2000ms);

    auto rest = peer.read_lines(1, 300ms);
    assert(rest.empty());
    assert(client.stats().lines_sent == 1);
    std::cout << "  Blocked send release test passed!\n";
}

/**
 * @brief A stop request on the caller's token disconnects the client.
 */
void test_external_cancellation() {
    std::cout << "\n=== Testing External Cancellation ===\n";

    LoopbackListener listener;
    std::stop_source cancel;
    auto config = loopback_config(listener.port());
    config.cancellation = cancel.get_token();

    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(config, make_logger());
    client.subscribe(observer);
    client.connect();
    auto peer = listener.accept();

    cancel.request_stop();
    assert(observer->wait_for_closed());
    assert(observer->closed_count() == 1);
    assert(client.state() == ConnectionState::Disconnected);

    client.disconnect();
    assert(observer->closed_count() == 1);
    assert(client.read_loop_fault() == nullptr);
    std::cout << "  External cancellation test passed!\n";
}

/**
 * @brief A client whose caller token was stopped before connect reports a cancelled connect.
 */
void test_connect_after_cancellation() {
    std::cout << "\n=== Testing Connect After Cancellation ===\n";

    LoopbackListener listener;
    std::stop_source cancel;
    cancel.request_stop();
    auto config = loopback_config(listener.port());
    config.cancellation = cancel.get_token();

    LineClient client(config, make_logger());
    assert(client.state() == ConnectionState::Disconnected);

    bool cancelled = false;
    try {
        client.connect();
    } catch (const transport::ConnectionError& e) {
        cancelled = e.code() == std::errc::operation_canceled;
        std::cout << "  ConnectionError: " << e.what() << "\n";
    }
    assert(cancelled);

    cancelled = false;
    try {
        client.connect(client::ProxyEndpoint{"127.0.0.1", listener.port(), ""});
    } catch (const transport::ConnectionError& e) {
        cancelled = e.code() == std::errc::operation_canceled;
    }
    assert(cancelled);
    assert(client.state() == ConnectionState::Disconnected);
    assert(!listener.accept(100ms).valid());
    std::cout << "  Connect-after-cancellation test passed!\n";
}

/**
 * @brief A write stuck on a peer that stops reading resolves cleanly when the client disconnects.
 */
void test_inflight_write_interrupted_by_disconnect() {
    std::cout << "\n=== Testing In-Flight Write Interrupted By Disconnect ===\n";

    LoopbackListener listener;
    LineClient client(loopback_config(listener.port()), make_logger());
    client.connect();
    auto peer = listener.accept();
    assert(peer.valid());

    // Far more than the loopback socket buffers hold while the peer reads nothing.
    auto pending = client.send(std::string(32 * 1024 * 1024, 'x'));
    assert(!is_ready(pending, 200ms));

    client.disconnect();
    assert(is_ready(pending, 2000ms));
    bool threw = false;
    try {
        pending.get();
    } catch (const std::exception& e) {
        threw = true;
        std::cout << "  unexpected: " << e.what() << "\n";
    }
    assert(!threw);
    assert(client.stats().lines_sent == 0);
    std::cout << "  In-flight write interruption test passed!\n";
}

/**
 * @brief Direct connect reaches an IPv6 listener (skipped when ::1 is unavailable).
 */
void test_direct_connect_ipv6() {
    std::cout << "\n=== Testing Direct Connect Over IPv6 ===\n";

    std::unique_ptr<LoopbackListener> listener;
    try {
        listener = std::make_unique<LoopbackListener>(AF_INET6);
    } catch (const std::runtime_error&) {
        std::cout << "  ::1 unavailable, skipped\n";
        return;
    }

    LineClientConfig config = loopback_config(listener->port());
    config.host = "::1";
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(config, make_logger());
    client.subscribe(observer);
    client.connect();
    assert(client.state() == ConnectionState::Connected);
    assert(client.remote_endpoint() == "[::1]:" + std::to_string(listener->port()));

    auto peer = listener->accept();
    assert(peer.valid());
    client.send("over v6").get();
    auto lines = peer.read_lines(1, 1000ms);
    assert(lines.size() == 1 && lines[0].text == "over v6");

    peer.send_raw("reply\n");
    assert(observer->wait_for_messages(1));
    assert(observer->messages()[0] == "reply");
    std::cout << "  IPv6 connect test passed!\n";
}

/**
 * @brief A connection reset is a read fault: stored on the loop, one closed notification.
 */
void test_read_fault_on_reset() {
    std::cout << "\n=== Testing Read Fault On Reset ===\n";

    LoopbackListener listener;
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(listener.port()), make_logger());
    client.subscribe(observer);
    client.connect();
    auto peer = listener.accept();

    peer.reset();
    assert(observer->wait_for_closed());
    assert(client.state() == ConnectionState::Disconnected);

    std::exception_ptr fault;
    auto deadline = test_support::Clock::now() + 2000ms;
    while (!fault && test_support::Clock::now() < deadline) {
        fault = client.read_loop_fault();
        if (!fault) std::this_thread::sleep_for(5ms);
    }
    assert(fault);
    bool is_transport_fault = false;
    try {
        std::rethrow_exception(fault);
    } catch (const transport::TransportFault& e) {
        is_transport_fault = true;
        std::cout << "  TransportFault: " << e.what() << "\n";
    }
    assert(is_transport_fault);
    assert(observer->closed_count() == 1);
    std::cout << "  Read fault test passed!\n";
}

/// Replies to every message from inside the callback.
class EchoObserver : public client::ILineClientObserver {
public:
    explicit EchoObserver(LineClient& client) : client_(client) {}
    void on_message_received(const std::string& message) override {
        pending_.push_back(client_.send("echo " + message));
    }
    void on_connection_closed() override {}
    std::vector<std::future<void>> pending_;
private:
    LineClient& client_;
};

/**
 * @brief Observers may send from the callback; unsubscribed observers stop receiving.
 */
void test_observer_callbacks() {
    std::cout << "\n=== Testing Observer Callbacks ===\n";

    LoopbackListener listener;
    LineClient client(loopback_config(listener.port()), make_logger());
    auto echo = std::make_shared<EchoObserver>(client);
    auto recorder = std::make_shared<RecordingObserver>();
    client.subscribe(echo);
    client.subscribe(recorder);
    client.connect();
    auto peer = listener.accept();

    peer.send_raw("ping\n");
    auto replies = peer.read_lines(1, 2000ms);
    assert(replies.size() == 1);
    assert(replies[0].text == "echo ping");
    assert(recorder->wait_for_messages(1));

    client.unsubscribe(echo);
    peer.send_raw("quiet\n");
    assert(recorder->wait_for_messages(2));
    auto none = peer.read_lines(1, 300ms);
    assert(none.empty());

    client.disconnect();
    std::cout << "  Observer callback test passed!\n";
}

/**
 * @brief A granted SOCKS4 request turns the proxy connection into the transport.
 */
void test_proxy_connect_granted() {
    std::cout << "\n=== Testing SOCKS4 Connect Granted ===\n";

    ScriptedSocks4Proxy proxy(0x5A);
    auto observer = std::make_shared<RecordingObserver>();
    LineClient client(loopback_config(4242), make_logger());
    client.subscribe(observer);

    client::ProxyEndpoint endpoint{"127.0.0.1", proxy.port(), "bob"};
    client.connect(endpoint);
    assert(client.state() == ConnectionState::Connected);

    auto request = proxy.wait_request();
    const std::vector<uint8_t> expected{0x04, 0x01, 0x10, 0x92, 0x7F, 0x00, 0x00, 0x01, 'b', 'o', 'b', 0x00};
    assert(request == expected);

    auto& relay = proxy.relayed();
    relay.send_raw("welcome\n");
    assert(observer->wait_for_messages(1));
    assert(observer->messages()[0] == "welcome");

    client.send("over the proxy").get();
    auto lines = relay.read_lines(1, 2000ms);
    assert(lines.size() == 1 && lines[0].text == "over the proxy");

    client.disconnect();
    assert(observer->closed_count() == 1);
    std::cout << "  SOCKS4 granted test passed!\n";
}

/**
 * @brief Refusal statuses map to ProxyError kinds and leave the client Unconnected.
 */
void test_proxy_refusals() {
    std::cout << "\n=== Testing SOCKS4 Refusals ===\n";

    struct Case { uint8_t status; transport::ProxyErrorKind kind; };
    const Case cases[] = {
        {0x5B, transport::ProxyErrorKind::Rejected},
        {0x5C, transport::ProxyErrorKind::IdentdUnreachable},
        {0x5D, transport::ProxyErrorKind::IdentdMismatch},
        {0xFF, transport::ProxyErrorKind::Unknown},
    };
    for (const auto& c : cases) {
        ScriptedSocks4Proxy proxy(c.status);
        auto observer = std::make_shared<RecordingObserver>();
        LineClient client(loopback_config(4242), make_logger());
        client.subscribe(observer);

        bool threw = false;
        try {
            client.connect(client::ProxyEndpoint{"127.0.0.1", proxy.port(), ""});
        } catch (const transport::ProxyError& e) {
            threw = true;
            assert(e.kind() == c.kind);
            assert(e.status() == c.status);
            std::cout << "  ProxyError: " << e.what() << "\n";
        }
        assert(threw);
        assert(client.state() == ConnectionState::Unconnected);
        assert(observer->closed_count() == 0);
        assert(client.read_loop_fault() == nullptr);
        proxy.wait_request();
    }
    std::cout << "  SOCKS4 refusal test passed!\n";
}

/**
 * @brief A proxy that hangs up before a full reply fails the connect with ConnectionError.
 */
void test_proxy_closes_early() {
    std::cout << "\n=== Testing SOCKS4 Proxy Closing Early ===\n";

    ScriptedSocks4Proxy proxy(0x5A, ScriptedSocks4Proxy::Mode::CloseBeforeReply);
    LineClient client(loopback_config(4242), make_logger());

    bool threw = false;
    try {
        client.connect(client::ProxyEndpoint{"127.0.0.1", proxy.port(), ""});
    } catch (const transport::ConnectionError& e) {
        threw = true;
        assert(e.code() == std::errc::connection_aborted);
    }
    assert(threw);
    assert(client.state() == ConnectionState::Unconnected);
    proxy.wait_request();

    threw = false;
    try {
        client.connect(client::ProxyEndpoint{"127.0.0.1", 0, ""});
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    assert(client.state() == ConnectionState::Unconnected);
    std::cout << "  SOCKS4 early close test passed!\n";
}

} // namespace

int main() {
    std::cout << "LineClient Tests\n";
    std::cout << "================\n";

    test_receive_then_peer_close();
    test_crlf_and_trailing_partial_line();
    test_connect_refused();
    test_argument_and_state_checks();
    test_sends_are_serialized_and_throttled();
    test_empty_send_is_noop();
    test_disconnect_is_idempotent();
    test_disconnect_before_connect();
    test_blocked_send_released_by_disconnect();
    test_external_cancellation();
    test_connect_after_cancellation();
    test_inflight_write_interrupted_by_disconnect();
    test_direct_connect_ipv6();
    test_read_fault_on_reset();
    test_observer_callbacks();
    test_proxy_connect_granted();
    test_proxy_refusals();
    test_proxy_closes_early();

    std::cout << "\n================\n";
    std::cout << "All LineClient tests passed!\n";
    return 0;
}
