/**
 * \file client/ClientOptions.hpp
 * \brief Option types and accessors for the linewire-client program.
 */
#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "LineClient.hpp"

/** \brief Everything the console program needs, resolved from CLI and config. */
struct ClientOptions {
    client::LineClientConfig connection{};                ///< Target host/port and send interval.
    std::optional<client::ProxyEndpoint> proxy{};         ///< Set when --proxy-host is given.
    std::string log_level{"info"};                        ///< debug|info|warning|error
};

/** \brief Helper API for accessing client-specific CLI and config options. */
namespace client { namespace client_opts {
    std::optional<std::string> get_host();
    std::optional<int> get_port();
    std::optional<int> get_send_interval_ms();
    std::optional<std::string> get_proxy_host();
    std::optional<int> get_proxy_port();
    std::optional<std::string> get_proxy_user();
    std::optional<std::string> get_log_level();

    /** \brief Assemble ClientOptions after a successful parse.
     *  \param error Receives a message when a required option is missing or out of range.
     */
    std::optional<ClientOptions> resolve(std::string& error);

    void register_options();
} }
