/**
 * \file client/clientMain.cpp
 * \brief Entrypoint for linewire-client: stdin lines out, received lines to stdout.
 */

#include "ClientOptions.hpp"
#include "LineClient.hpp"
#include "LineDecoder.hpp"
#include "logger.hpp"
#include "transport/TransportErrors.hpp"
#include <options/Options.hpp>
#include <processUtils.hpp>

#include <atomic>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <iostream>
#include <mutex>
#include <pthread.h>
#include <poll.h>
#include <stdexcept>
#include <stop_token>
#include <system_error>
#include <thread>
#include <unistd.h>
#include <vector>

namespace {

/// Prints every received line to stdout.
class StdoutPrinter : public client::ILineClientObserver {
public:
    void on_message_received(const std::string& message) override {
        std::lock_guard<std::mutex> lk(out_mutex_);
        std::cout << message << '\n' << std::flush;
    }
    void on_connection_closed() override {
        closed_.store(true, std::memory_order_release);
    }
    bool closed() const { return closed_.load(std::memory_order_acquire); }

private:
    std::mutex out_mutex_;
    std::atomic<bool> closed_{false};
};

/// Turns SIGINT/SIGTERM into a stop request; SIGUSR1 ends the thread.
class SignalWatcher {
public:
    SignalWatcher(std::stop_source stop, std::shared_ptr<Logger> logger)
        : stop_(std::move(stop)), logger_(std::move(logger)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        sigaddset(&signals_, SIGUSR1);
        // Blocked before any other thread exists, so every thread inherits the mask.
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { run(); });
    }
    ~SignalWatcher() {
        pthread_kill(thread_.native_handle(), SIGUSR1);
        thread_.join();
    }
    SignalWatcher(const SignalWatcher&) = delete;
    SignalWatcher& operator=(const SignalWatcher&) = delete;

private:
    void run() {
        ProcessUtils::set_current_thread_name("signals");
        while (true) {
            int sig = 0;
            if (sigwait(&signals_, &sig) != 0) continue;
            if (sig == SIGUSR1) return;
            if (logger_) logger_->info(std::string("Received ") + (sig == SIGINT ? "SIGINT" : "SIGTERM") + ", disconnecting");
            stop_.request_stop();
        }
    }

    sigset_t signals_{};
    std::stop_source stop_;
    std::shared_ptr<Logger> logger_;
    std::thread thread_;
};

/// Forward stdin lines until EOF, cancellation or connection loss. Returns false on a send fault.
bool pump_stdin(client::LineClient& client, const StdoutPrinter& printer, const std::stop_token& stop,
                const std::shared_ptr<Logger>& logger) {
    client::LineDecoder decoder;
    std::vector<std::string> lines;
    char buf[4096];
    auto send_line = [&](const std::string& line) {
        try {
            client.send(line).get();
            return true;
        } catch (const transport::TransportFault& e) {
            logger->error(std::string("Send failed: ") + e.what());
            return false;
        } catch (const std::invalid_argument& e) {
            logger->warning(std::string("Line not sent: ") + e.what());
            return true;
        }
    };

    while (!stop.stop_requested() && !printer.closed()) {
        pollfd pfd{};
        pfd.fd = STDIN_FILENO;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, 200);
        if (ready < 0) {
            if (errno == EINTR) continue;
            logger->error(std::string("poll(stdin) failed: ") + std::strerror(errno));
            return true;
        }
        if (ready == 0) continue;

        ssize_t n = ::read(STDIN_FILENO, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            logger->error(std::string("read(stdin) failed: ") + std::strerror(errno));
            return true;
        }
        if (n == 0) {
            std::string rest;
            if (decoder.flush(rest) && !send_line(rest)) return false;
            logger->debug("stdin closed");
            return true;
        }

        lines.clear();
        decoder.feed(buf, static_cast<size_t>(n), lines);
        for (const auto& line : lines) {
            if (!send_line(line)) return false;
        }
    }
    return true;
}

} // namespace

/** \brief Entrypoint for the linewire-client binary. */
int main(int argc, char* argv[]) {
    try {
        std::string opt_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opt_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0;
        }
        if (parse_res == shared_opts::Options::ParseResult::Error) {
            std::cerr << "linewire-client option parse error: " << opt_err << std::endl;
            return 2;
        }
        auto opts = client::client_opts::resolve(opt_err);
        if (!opts) {
            std::cerr << "linewire-client option error: " << opt_err << std::endl;
            return 2;
        }

        // Setup logger; stdout carries protocol lines only
        auto logger = std::make_shared<Logger>("linewire");
        auto sink = std::make_shared<StderrSink>();
        sink->set_level(parse_log_level(opts->log_level).value_or(LogLevel::Info));
        logger->add_sink(sink);
        if (auto cfg = shared_opts::Options::get_config_file()) {
            logger->debug("Loaded config " + cfg->string());
        }

        std::stop_source cancel;
        SignalWatcher signals(cancel, logger);

        opts->connection.cancellation = cancel.get_token();
        client::LineClient client(opts->connection, logger);
        auto printer = std::make_shared<StdoutPrinter>();
        client.subscribe(printer);

        try {
            if (opts->proxy) {
                client.connect(*opts->proxy);
            } else {
                client.connect();
            }
        } catch (const transport::ProxyError& e) {
            logger->error(std::string("Proxy refused: ") + e.what());
            return 1;
        } catch (const transport::ConnectionError& e) {
            if (e.code() == std::errc::operation_canceled && cancel.stop_requested()) {
                logger->info("Connect interrupted");
                return 0;
            }
            logger->error(std::string("Connect failed: ") + e.what());
            return 1;
        }

        bool sends_ok = pump_stdin(client, *printer, cancel.get_token(), logger);
        client.disconnect();

        if (!sends_ok || client.read_loop_fault()) {
            return 1;
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "linewire-client error: " << e.what() << std::endl;
        return 1;
    }
}
