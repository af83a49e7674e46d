/**
 * \file client/ClientOptions.cpp
 * \brief CLI and configuration provider for the linewire-client program.
 * \details Reads defaults from the `"client"` object of the JSON config:
 * `{"client": {"host": "...", "port": 23, "send_interval_ms": 500,
 *   "proxy": {"host": "...", "port": 1080, "user": "..."}, "log_level": "info"}}`.
 */

#include "ClientOptions.hpp"
#include <options/Options.hpp>
#include <nlohmann/json.hpp>
#include <CLI/CLI.hpp>
#include <optional>
#include <string>

namespace client { namespace client_opts {

static std::optional<std::string> g_host;
static std::optional<int> g_port;
static std::optional<int> g_send_interval_ms;
static std::optional<std::string> g_proxy_host;
static std::optional<int> g_proxy_port;
static std::optional<std::string> g_proxy_user;
static std::optional<std::string> g_log_level;

std::optional<std::string> get_host() { return g_host; }
std::optional<int> get_port() { return g_port; }
std::optional<int> get_send_interval_ms() { return g_send_interval_ms; }
std::optional<std::string> get_proxy_host() { return g_proxy_host; }
std::optional<int> get_proxy_port() { return g_proxy_port; }
std::optional<std::string> get_proxy_user() { return g_proxy_user; }
std::optional<std::string> get_log_level() { return g_log_level; }

void register_options() {
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j){
        g_host.reset();
        g_port.reset();
        g_proxy_host.reset();
        g_proxy_port.reset();
        g_proxy_user.reset();
        int interval_default = 0;
        std::string level_default = "info";
        if (j.contains("client") && j["client"].is_object()) {
            const auto& c = j["client"];
            if (c.contains("host") && c["host"].is_string()) g_host = c["host"].get<std::string>();
            if (c.contains("port") && c["port"].is_number_integer()) g_port = c["port"].get<int>();
            if (c.contains("send_interval_ms") && c["send_interval_ms"].is_number_integer()) interval_default = c["send_interval_ms"].get<int>();
            if (c.contains("log_level") && c["log_level"].is_string()) level_default = c["log_level"].get<std::string>();
            if (c.contains("proxy") && c["proxy"].is_object()) {
                const auto& p = c["proxy"];
                if (p.contains("host") && p["host"].is_string()) g_proxy_host = p["host"].get<std::string>();
                if (p.contains("port") && p["port"].is_number_integer()) g_proxy_port = p["port"].get<int>();
                if (p.contains("user") && p["user"].is_string()) g_proxy_user = p["user"].get<std::string>();
            }
        }
        g_send_interval_ms = interval_default;
        g_log_level = level_default;

        app.add_option("--host", g_host, "Server host name or IPv4 address")
            ->group("Connection");
        app.add_option("--port", g_port, "Server TCP port")
            ->check(CLI::Range(1, 65535))
            ->group("Connection");
        app.add_option("--send-interval-ms", g_send_interval_ms, "Minimum delay between consecutive sends")
            ->check(CLI::NonNegativeNumber)
            ->group("Connection");

        app.add_option("--proxy-host", g_proxy_host, "SOCKS4 proxy host")
            ->group("Proxy");
        app.add_option("--proxy-port", g_proxy_port, "SOCKS4 proxy port")
            ->check(CLI::Range(1, 65535))
            ->group("Proxy");
        app.add_option("--proxy-user", g_proxy_user, "SOCKS4 user id")
            ->group("Proxy");

        app.add_option("--log-level", g_log_level, "Log level: debug|info|warning|error")
            ->check(CLI::IsMember({"debug", "info", "warning", "error"}))
            ->group("General");
    });
}

std::optional<ClientOptions> resolve(std::string& error) {
    if (!g_host || g_host->empty()) {
        error = "a server host is required (--host or client.host)";
        return std::nullopt;
    }
    if (!g_port) {
        error = "a server port is required (--port or client.port)";
        return std::nullopt;
    }
    if (*g_port < 1 || *g_port > 65535) {
        error = "server port " + std::to_string(*g_port) + " outside 1-65535";
        return std::nullopt;
    }

    ClientOptions out;
    out.connection.host = *g_host;
    out.connection.port = *g_port;
    out.connection.min_send_interval = std::chrono::milliseconds(g_send_interval_ms.value_or(0));
    if (out.connection.min_send_interval.count() < 0) {
        error = "send interval must not be negative";
        return std::nullopt;
    }
    out.log_level = g_log_level.value_or("info");

    if (g_proxy_host && !g_proxy_host->empty()) {
        ProxyEndpoint proxy;
        proxy.host = *g_proxy_host;
        proxy.port = g_proxy_port.value_or(1080);
        proxy.user_id = g_proxy_user.value_or("");
        if (proxy.port < 1 || proxy.port > 65535) {
            error = "proxy port " + std::to_string(proxy.port) + " outside 1-65535";
            return std::nullopt;
        }
        out.proxy = proxy;
    } else if (g_proxy_port || g_proxy_user) {
        error = "--proxy-port/--proxy-user require --proxy-host";
        return std::nullopt;
    }
    return out;
}

} } // namespace client::client_opts

namespace {
    struct ClientOptsAutoReg {
        ClientOptsAutoReg() { client::client_opts::register_options(); }
    } client_opts_auto_reg_instance; // NOLINT(cert-err58-cpp)
}
