/**
 * \file Socks4.hpp
 * \brief SOCKS4 CONNECT request/response framing and the client handshake.
 * \details SOCKS4 is IPv4-only and takes a single round trip: the client writes
 * one request, the proxy answers with exactly 8 bytes and then relays the
 * stream on success.
 */
#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include "logger.hpp"
#include "transport/TransportErrors.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/socket/HostResolver.hpp"

namespace transport {

class CoroSocketAdapter;

/** \defgroup proxy_module SOCKS4 Proxy
 *  \brief Request/response codec and handshake coroutine for SOCKS4 CONNECT.
 */

/** \addtogroup proxy_module
 *  @{ */

namespace socks4 {
constexpr uint8_t version = 0x04;
constexpr uint8_t command_connect = 0x01;
constexpr uint8_t status_granted = 0x5A;
constexpr uint8_t status_rejected = 0x5B;
constexpr uint8_t status_identd_unreachable = 0x5C;
constexpr uint8_t status_identd_mismatch = 0x5D;
constexpr size_t response_size = 8;
}

/** \brief Immutable SOCKS4 CONNECT request.
 *  \details Wire layout: VN(1)=4, CD(1)=1, DSTPORT(2, big-endian), DSTIP(4),
 *  USERID(N), NUL(1).
 */
class Socks4Request {
public:
    /** \throws std::invalid_argument if `user_id` contains a NUL byte. */
    Socks4Request(const Ipv4Address& destination, uint16_t port, std::string user_id = {});

    const Ipv4Address& destination() const noexcept { return destination_; }
    uint16_t port() const noexcept { return port_; }
    const std::string& user_id() const noexcept { return user_id_; }

    /** \brief Encoded request, ready to write. */
    const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

private:
    Ipv4Address destination_;
    uint16_t port_;
    std::string user_id_;
    std::vector<uint8_t> bytes_;
};

/** \brief The proxy's 8-byte reply. Only the status byte is interpreted. */
class Socks4Response {
public:
    explicit Socks4Response(const std::array<uint8_t, socks4::response_size>& raw) : raw_(raw) {}

    uint8_t status() const noexcept { return raw_[1]; }
    bool granted() const noexcept { return status() == socks4::status_granted; }
    const std::array<uint8_t, socks4::response_size>& raw() const noexcept { return raw_; }

private:
    std::array<uint8_t, socks4::response_size> raw_;
};

/** \brief Map a non-success status byte to its error kind. */
ProxyErrorKind classify_socks4_status(uint8_t status) noexcept;

/** \brief Build the ProxyError for a refused request. */
ProxyError make_socks4_error(uint8_t status);

/** \brief Perform the handshake over a connected proxy stream.
 *  \details Writes the full request, then reads exactly 8 bytes.
 *  \throws ConnectionError if the proxy closes before replying (`connection_aborted`)
 *          or the exchange fails or is cancelled.
 *  \throws ProxyError if the status is not 0x5A.
 */
Task<void> socks4_handshake(std::shared_ptr<CoroSocketAdapter> stream,
                            Socks4Request request,
                            std::stop_token stop,
                            std::shared_ptr<Logger> logger);

/** @} */

} // namespace transport
