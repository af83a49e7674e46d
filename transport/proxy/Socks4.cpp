/**
 * \file Socks4.cpp
 * \brief SOCKS4 request encoding, status mapping and handshake coroutine.
 * \ingroup proxy_module
 */
#include "Socks4.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"

#include <cstdio>
#include <stdexcept>
#include <system_error>

namespace transport {

namespace {

std::string hex_byte(uint8_t value) {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "0x%02X", static_cast<unsigned>(value));
    return buf;
}

} // namespace

Socks4Request::Socks4Request(const Ipv4Address& destination, uint16_t port, std::string user_id)
    : destination_(destination), port_(port), user_id_(std::move(user_id)) {
    if (user_id_.find('\0') != std::string::npos) {
        throw std::invalid_argument("SOCKS4 user id must not contain NUL bytes");
    }
    bytes_.reserve(9 + user_id_.size());
    bytes_.push_back(socks4::version);
    bytes_.push_back(socks4::command_connect);
    bytes_.push_back(static_cast<uint8_t>((port_ >> 8) & 0xFF));
    bytes_.push_back(static_cast<uint8_t>(port_ & 0xFF));
    bytes_.insert(bytes_.end(), destination_.begin(), destination_.end());
    bytes_.insert(bytes_.end(), user_id_.begin(), user_id_.end());
    bytes_.push_back(0x00);
}

ProxyErrorKind classify_socks4_status(uint8_t status) noexcept {
    switch (status) {
        case socks4::status_rejected: return ProxyErrorKind::Rejected;
        case socks4::status_identd_unreachable: return ProxyErrorKind::IdentdUnreachable;
        case socks4::status_identd_mismatch: return ProxyErrorKind::IdentdMismatch;
        default: return ProxyErrorKind::Unknown;
    }
}

ProxyError make_socks4_error(uint8_t status) {
    auto kind = classify_socks4_status(status);
    return ProxyError(kind, status,
                      "SOCKS4 proxy refused connection: " + std::string(to_string(kind)) +
                      " (status " + hex_byte(status) + ")");
}

Task<void> socks4_handshake(std::shared_ptr<CoroSocketAdapter> stream,
                            Socks4Request request,
                            std::stop_token stop,
                            std::shared_ptr<Logger> logger) {
    const auto& out = request.bytes();
    std::array<uint8_t, socks4::response_size> reply{};
    size_t received = 0;
    try {
        co_await stream->async_write(out.data(), out.size(), stop);
        received = co_await stream->async_read_exact(reply.data(), reply.size(), stop);
    } catch (const std::system_error& e) {
        throw ConnectionError(e.code(), std::string("SOCKS4 handshake failed: ") + e.what());
    }

    if (received < reply.size()) {
        throw ConnectionError(std::make_error_code(std::errc::connection_aborted),
                              "SOCKS4 proxy closed the connection after " + std::to_string(received) +
                              " of " + std::to_string(reply.size()) + " reply bytes");
    }

    Socks4Response response(reply);
    if (!response.granted()) {
        if (logger) logger->warning("SOCKS4 request to " + to_string(request.destination()) + ":" +
                                    std::to_string(request.port()) + " refused, status " +
                                    hex_byte(response.status()));
        throw make_socks4_error(response.status());
    }
    if (logger) logger->debug("SOCKS4 relay granted to " + to_string(request.destination()) + ":" +
                              std::to_string(request.port()));
}

} // namespace transport
