/**
 * \file LineClient.cpp
 * \brief Connect, teardown and event plumbing for the line client.
 * \ingroup client_module
 */
#include "LineClient.hpp"

#include <algorithm>
#include <stdexcept>
#include <system_error>

#include "transport/TransportErrors.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"
#include "transport/proxy/Socks4.hpp"
#include "transport/socket/HostResolver.hpp"

namespace client {

namespace {

bool valid_port(int port) { return port >= 1 && port <= 65535; }

std::string endpoint_string(const std::string& host, int port) {
    return host + ":" + std::to_string(port);
}

std::future<void> ready_future() {
    std::promise<void> done;
    done.set_value();
    return done.get_future();
}

} // namespace

const char* to_string(ConnectionState state) {
    switch (state) {
        case ConnectionState::Unconnected: return "unconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Disconnected: return "disconnected";
    }
    return "unknown";
}

LineClient::LineClient(LineClientConfig config,
                       std::shared_ptr<Logger> logger,
                       std::shared_ptr<transport::CoroIoContext> ctx)
    : config_(std::move(config)),
      logger_(std::move(logger)),
      context_(ctx ? std::move(ctx) : transport::default_loop()),
      throttle_(context_, config_.min_send_interval, logger_) {
    if (config_.host.empty()) {
        throw std::invalid_argument("LineClient: host must not be empty");
    }
    if (!valid_port(config_.port)) {
        throw std::invalid_argument("LineClient: port " + std::to_string(config_.port) + " outside 1-65535");
    }
    if (config_.min_send_interval.count() < 0) {
        throw std::invalid_argument("LineClient: minimum send interval must not be negative");
    }
    if (config_.cancellation.stop_possible()) {
        external_link_.emplace(config_.cancellation, std::function<void()>([this] {
            if (logger_) logger_->debug("LineClient: external cancellation requested");
            disconnect();
        }));
    }
}

LineClient::~LineClient() {
    // Detach from the caller's token first so its callback cannot race the teardown below.
    external_link_.reset();
    dispose();

    std::unique_ptr<Task<void>> read_task;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        read_task = std::move(read_task_);
    }
    if (read_task) read_task->wait();

    std::lock_guard<std::mutex> lk(sends_mutex_);
    for (auto& task : pending_sends_) {
        task->wait();
    }
    pending_sends_.clear();
}

void LineClient::begin_connect() {
    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ == ConnectionState::Disconnected && closed_from_ == ConnectionState::Unconnected) {
        throw transport::ConnectionError(std::make_error_code(std::errc::operation_canceled),
                                         "connect to " + endpoint_string(config_.host, config_.port) +
                                             " cancelled before it started");
    }
    if (state_ != ConnectionState::Unconnected) {
        throw std::logic_error(std::string("LineClient::connect: client is ") + to_string(state_));
    }
    state_ = ConnectionState::Connecting;
}

void LineClient::abort_connect() noexcept {
    std::shared_ptr<transport::CoroSocketAdapter> stream;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        // A teardown during the attempt already made the client terminal.
        if (state_ == ConnectionState::Connecting) {
            state_ = ConnectionState::Unconnected;
        }
        stream = std::move(stream_);
    }
    if (stream) stream->close();
}

void LineClient::connect() {
    begin_connect();
    const auto target = endpoint_string(config_.host, config_.port);
    try {
        auto stream = transport::CoroSocketAdapter::create_client(logger_, context_);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stream_ = stream;
        }
        std::error_code ec;
        stream->connect(config_.host, config_.port, scope_.get_token(), ec);
        if (ec) {
            if (logger_) logger_->warning("Connect to " + target + " failed: " + ec.message());
            throw transport::ConnectionError(ec, "connect to " + target + " failed");
        }
        complete_connect(std::move(stream), target);
    } catch (const std::exception&) {
        abort_connect();
        throw;
    }
}

void LineClient::connect(const ProxyEndpoint& proxy) {
    begin_connect();
    const auto target = endpoint_string(config_.host, config_.port);
    const auto via = endpoint_string(proxy.host, proxy.port);
    try {
        if (!valid_port(proxy.port)) {
            throw std::invalid_argument("LineClient: proxy port " + std::to_string(proxy.port) + " outside 1-65535");
        }

        std::error_code ec;
        auto destination = transport::resolve_ipv4(config_.host, ec);
        if (!destination) {
            if (logger_) logger_->warning("Cannot resolve " + config_.host + ": " + ec.message());
            throw transport::ConnectionError(ec, "resolve " + config_.host + " failed");
        }
        transport::Socks4Request request(*destination, static_cast<uint16_t>(config_.port), proxy.user_id);

        auto stream = transport::CoroSocketAdapter::create_client(logger_, context_);
        {
            std::lock_guard<std::mutex> lk(mutex_);
            stream_ = stream;
        }
        stream->connect(proxy.host, proxy.port, scope_.get_token(), ec);
        if (ec) {
            if (logger_) logger_->warning("Connect to proxy " + via + " failed: " + ec.message());
            throw transport::ConnectionError(ec, "connect to proxy " + via + " failed");
        }

        auto handshake = transport::socks4_handshake(stream, std::move(request), scope_.get_token(), logger_);
        handshake.wait();
        handshake.rethrow_if_failed();

        complete_connect(std::move(stream), target + " via SOCKS4 proxy " + via);
    } catch (const std::exception&) {
        abort_connect();
        throw;
    }
}

void LineClient::complete_connect(std::shared_ptr<transport::CoroSocketAdapter> stream, const std::string& via) {
    LineReaderCallbacks callbacks;
    callbacks.on_line = [this](const std::string& line) { notify_message(line); };
    callbacks.on_end_of_stream = [this] { teardown("peer closed the connection"); };
    callbacks.on_fault = [this](const std::error_code& ec) { teardown("read fault: " + ec.message()); };

    std::lock_guard<std::mutex> lk(mutex_);
    if (state_ != ConnectionState::Connecting) {
        throw transport::ConnectionError(std::make_error_code(std::errc::operation_canceled),
                                         "disconnected while connecting to " + via);
    }
    state_ = ConnectionState::Connected;
    reader_ = std::make_unique<LineReader>(stream, scope_.get_token(), std::move(callbacks), logger_);
    // run() suspends straight away to hop onto the loop, so holding the lock here is fine.
    read_task_ = std::make_unique<Task<void>>(reader_->run());
    if (logger_) logger_->info("Connected to " + via);
}

std::future<void> LineClient::send(std::string message) {
    if (message.empty()) {
        return ready_future();
    }
    if (message.find('\n') != std::string::npos) {
        throw std::invalid_argument("LineClient::send: message must not contain a newline");
    }

    std::shared_ptr<transport::CoroSocketAdapter> stream;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        switch (state_) {
            case ConnectionState::Unconnected:
            case ConnectionState::Connecting:
                throw std::logic_error(std::string("LineClient::send: client is ") + to_string(state_));
            case ConnectionState::Disconnected:
                return ready_future();
            case ConnectionState::Connected:
                break;
        }
        stream = stream_;
    }

    std::promise<void> done;
    auto result = done.get_future();
    auto task = std::make_unique<Task<void>>(
        throttle_.send(std::move(stream), std::move(message), scope_.get_token(), std::move(done)));

    std::lock_guard<std::mutex> lk(sends_mutex_);
    reap_finished_sends();
    pending_sends_.push_back(std::move(task));
    return result;
}

std::future<void> LineClient::send(std::optional<std::string> message) {
    if (!message) return ready_future();
    return send(std::move(*message));
}

std::future<void> LineClient::send(const char* message) {
    if (message == nullptr) return ready_future();
    return send(std::string(message));
}

void LineClient::reap_finished_sends() {
    pending_sends_.erase(std::remove_if(pending_sends_.begin(), pending_sends_.end(),
                                        [](const std::unique_ptr<Task<void>>& t) { return t->done(); }),
                         pending_sends_.end());
}

void LineClient::disconnect() noexcept {
    teardown("disconnect requested");
}

void LineClient::dispose() noexcept {
    if (disposed_.exchange(true)) return;
    disconnect();
}

void LineClient::teardown(const std::string& reason) noexcept {
    if (closed_.exchange(true, std::memory_order_acq_rel)) return;

    scope_.request_stop();
    context_->wake();

    std::shared_ptr<transport::CoroSocketAdapter> stream;
    ConnectionState previous;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        previous = state_;
        closed_from_ = previous;
        state_ = ConnectionState::Disconnected;
        stream = stream_;
    }
    if (stream) {
        stream->shutdown();
        stream->close();
    }

    try {
        if (logger_) {
            logger_->info("Connection to " + endpoint_string(config_.host, config_.port) + " closed (" + reason +
                          ", was " + to_string(previous) + ")");
        }
    } catch (const std::exception&) {
        // best-effort
    }
    notify_closed();
}

void LineClient::subscribe(std::shared_ptr<ILineClientObserver> observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lk(observers_mutex_);
    observers_.push_back(std::move(observer));
}

void LineClient::unsubscribe(const std::shared_ptr<ILineClientObserver>& observer) {
    std::lock_guard<std::mutex> lk(observers_mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

void LineClient::notify_message(const std::string& message) {
    std::vector<std::shared_ptr<ILineClientObserver>> observers;
    {
        std::lock_guard<std::mutex> lk(observers_mutex_);
        observers = observers_;
    }
    for (auto& observer : observers) {
        try {
            observer->on_message_received(message);
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("Observer threw from on_message_received: ") + e.what());
        }
    }
}

void LineClient::notify_closed() noexcept {
    try {
        std::vector<std::shared_ptr<ILineClientObserver>> observers;
        {
            std::lock_guard<std::mutex> lk(observers_mutex_);
            observers = observers_;
        }
        for (auto& observer : observers) {
            try {
                observer->on_connection_closed();
            } catch (const std::exception& e) {
                if (logger_) logger_->error(std::string("Observer threw from on_connection_closed: ") + e.what());
            }
        }
    } catch (const std::exception& e) {
        if (logger_) logger_->error(std::string("Failed to deliver connection-closed: ") + e.what());
    }
}

ConnectionState LineClient::state() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return state_;
}

LineClientStats LineClient::stats() const {
    LineClientStats s;
    s.lines_sent = throttle_.lines_sent();
    s.bytes_sent = throttle_.bytes_sent();
    std::lock_guard<std::mutex> lk(mutex_);
    if (reader_) {
        s.lines_received = reader_->lines_received();
        s.bytes_received = reader_->bytes_received();
    }
    return s;
}

std::string LineClient::remote_endpoint() const {
    std::shared_ptr<transport::CoroSocketAdapter> stream;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        stream = stream_;
    }
    return stream ? stream->remote_endpoint() : std::string();
}

std::exception_ptr LineClient::read_loop_fault() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return read_task_ ? read_task_->exception() : nullptr;
}

} // namespace client
