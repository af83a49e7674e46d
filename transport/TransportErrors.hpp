/**
 * \file TransportErrors.hpp
 * \brief Exception types surfaced by the line client transport.
 * \details
 * - `ConnectionError`: establishing the TCP connection failed (resolution, refusal,
 *   unreachable host, proxy closing early). Carries the underlying `std::error_code`.
 * - `ProxyError`: the SOCKS4 proxy answered but refused to relay; carries the status byte.
 * - `TransportFault`: a read or write failed on an established connection without
 *   cancellation having been requested.
 */
#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <system_error>

namespace transport {

/** \brief Failure to establish a connection. */
class ConnectionError : public std::system_error {
public:
    ConnectionError(std::error_code code, const std::string& what)
        : std::system_error(code, what) {}
};

/** \brief Classification of a SOCKS4 refusal. */
enum class ProxyErrorKind {
    Rejected,           ///< 0x5B request rejected or failed
    IdentdUnreachable,  ///< 0x5C proxy could not reach identd on the client
    IdentdMismatch,     ///< 0x5D identd reported a different user id
    Unknown             ///< any other status byte
};

inline const char* to_string(ProxyErrorKind kind) {
    switch (kind) {
        case ProxyErrorKind::Rejected: return "request rejected or failed";
        case ProxyErrorKind::IdentdUnreachable: return "proxy cannot reach identd on the client";
        case ProxyErrorKind::IdentdMismatch: return "identd reported a different user id";
        case ProxyErrorKind::Unknown: return "unknown proxy status";
    }
    return "unknown proxy status";
}

/** \brief SOCKS4 proxy refused the relay request. */
class ProxyError : public std::runtime_error {
public:
    ProxyError(ProxyErrorKind kind, uint8_t status, const std::string& what)
        : std::runtime_error(what), kind_(kind), status_(status) {}

    ProxyErrorKind kind() const noexcept { return kind_; }
    /** \brief Raw status byte from the proxy reply. */
    uint8_t status() const noexcept { return status_; }

private:
    ProxyErrorKind kind_;
    uint8_t status_;
};

/** \brief Unexpected I/O failure on an established connection. */
class TransportFault : public std::system_error {
public:
    TransportFault(std::error_code code, const std::string& what)
        : std::system_error(code, what) {}
};

} // namespace transport
