/**
 * \file HostResolver.hpp
 * \brief Host name resolution with `std::error_code` reporting.
 * \ingroup socket_backend
 * \details Wraps `getaddrinfo` for `SOCK_STREAM`. Only the first returned
 * address is used. `resolve_ipv4` is restricted to `AF_INET` for SOCKS4;
 * `resolve_endpoint` accepts either family for direct connects.
 */
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <system_error>
#include <sys/socket.h>

namespace transport {

/** \brief IPv4 address in network byte order (a.b.c.d -> {a, b, c, d}). */
using Ipv4Address = std::array<std::uint8_t, 4>;

/** \brief Error category for `getaddrinfo` (EAI_*) failures. */
const std::error_category& resolver_category() noexcept;

/** \brief Resolve `host` to its first IPv4 address.
 *  \param host Host name or dotted-quad literal.
 *  \param error Set to a `resolver_category()` code on failure; cleared on success.
 *  \return The address, or `std::nullopt` when resolution failed.
 */
std::optional<Ipv4Address> resolve_ipv4(const std::string& host, std::error_code& error);

/** \brief Socket address ready for `::connect`. */
struct ResolvedEndpoint {
    sockaddr_storage address{};
    socklen_t length{0};
    int family{AF_UNSPEC};
};

/** \brief Resolve `host` (IPv4 or IPv6) and attach `port`.
 *  \param error Set to a `resolver_category()` code on failure; cleared on success.
 */
std::optional<ResolvedEndpoint> resolve_endpoint(const std::string& host, int port, std::error_code& error);

/** \brief Text form of a socket address: `a.b.c.d:port` or `[v6]:port`. Empty if unknown family. */
std::string format_endpoint(const sockaddr_storage& address);

/** \brief Dotted-quad text for logs. */
std::string to_string(const Ipv4Address& address);

} // namespace transport
