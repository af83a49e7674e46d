/**
 * \file HostResolver.cpp
 * \brief `getaddrinfo` wrapper and its error category.
 * \ingroup socket_backend
 */
#include "HostResolver.hpp"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <memory>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>

namespace transport {

namespace {

class ResolverCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "resolver"; }
    std::string message(int ev) const override { return ::gai_strerror(ev); }
};

struct AddrInfoDeleter {
    void operator()(addrinfo* info) const noexcept { if (info) ::freeaddrinfo(info); }
};

} // namespace

const std::error_category& resolver_category() noexcept {
    static const ResolverCategory category;
    return category;
}

namespace {

using AddrInfoPtr = std::unique_ptr<addrinfo, AddrInfoDeleter>;

AddrInfoPtr lookup(const std::string& host, int family, std::error_code& error) {
    error.clear();
    if (host.empty()) {
        error = std::make_error_code(std::errc::invalid_argument);
        return nullptr;
    }

    addrinfo hints{};
    hints.ai_family = family;
    hints.ai_socktype = SOCK_STREAM;

    addrinfo* raw = nullptr;
    int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &raw);
    AddrInfoPtr result(raw);
    if (rc != 0) {
        if (rc == EAI_SYSTEM) {
            error = std::error_code(errno, std::system_category());
        } else {
            error = std::error_code(rc, resolver_category());
        }
        return nullptr;
    }
    if (!result || !result->ai_addr) {
        error = std::error_code(EAI_NONAME, resolver_category());
        return nullptr;
    }
    return result;
}

} // namespace

std::optional<Ipv4Address> resolve_ipv4(const std::string& host, std::error_code& error) {
    auto result = lookup(host, AF_INET, error);
    if (!result) return std::nullopt;

    const auto* sin = reinterpret_cast<const sockaddr_in*>(result->ai_addr);
    Ipv4Address address{};
    std::memcpy(address.data(), &sin->sin_addr.s_addr, address.size());
    return address;
}

std::optional<ResolvedEndpoint> resolve_endpoint(const std::string& host, int port, std::error_code& error) {
    auto result = lookup(host, AF_UNSPEC, error);
    if (!result) return std::nullopt;

    ResolvedEndpoint endpoint;
    endpoint.family = result->ai_family;
    if (result->ai_family == AF_INET) {
        auto* sin = reinterpret_cast<sockaddr_in*>(&endpoint.address);
        std::memcpy(sin, result->ai_addr, sizeof(sockaddr_in));
        sin->sin_port = htons(static_cast<uint16_t>(port));
        endpoint.length = sizeof(sockaddr_in);
    } else if (result->ai_family == AF_INET6) {
        auto* sin6 = reinterpret_cast<sockaddr_in6*>(&endpoint.address);
        std::memcpy(sin6, result->ai_addr, sizeof(sockaddr_in6));
        sin6->sin6_port = htons(static_cast<uint16_t>(port));
        endpoint.length = sizeof(sockaddr_in6);
    } else {
        error = std::error_code(EAI_FAMILY, resolver_category());
        return std::nullopt;
    }
    return endpoint;
}

std::string format_endpoint(const sockaddr_storage& address) {
    char ip[INET6_ADDRSTRLEN] = {0};
    if (address.ss_family == AF_INET) {
        const auto* sin = reinterpret_cast<const sockaddr_in*>(&address);
        if (::inet_ntop(AF_INET, &sin->sin_addr, ip, sizeof(ip)) == nullptr) return {};
        return std::string(ip) + ":" + std::to_string(ntohs(sin->sin_port));
    }
    if (address.ss_family == AF_INET6) {
        const auto* sin6 = reinterpret_cast<const sockaddr_in6*>(&address);
        if (::inet_ntop(AF_INET6, &sin6->sin6_addr, ip, sizeof(ip)) == nullptr) return {};
        return "[" + std::string(ip) + "]:" + std::to_string(ntohs(sin6->sin6_port));
    }
    return {};
}

std::string to_string(const Ipv4Address& address) {
    return std::to_string(address[0]) + "." + std::to_string(address[1]) + "." +
           std::to_string(address[2]) + "." + std::to_string(address[3]);
}

} // namespace transport
