/**
 * @file test_socks4.cpp
 * @brief SOCKS4 request layout and status classification.
 */

#include "Socks4.hpp"

#include <cassert>
#include <sys/socket.h>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace transport;

namespace {

void test_request_layout() {
    std::cout << "\n=== Testing SOCKS4 Request Layout ===\n";

    Socks4Request request(Ipv4Address{203, 0, 113, 5}, 1153, "bob");
    const std::vector<uint8_t> expected{
        0x04, 0x01, 0x04, 0x81, 0xCB, 0x00, 0x71, 0x05,
        0x62, 0x6F, 0x62, 0x00,
    };
    assert(request.bytes() == expected);
    assert(request.port() == 1153);
    assert(request.user_id() == "bob");

    // No user id: header plus the terminator only
    Socks4Request anonymous(Ipv4Address{10, 1, 2, 3}, 65535);
    const std::vector<uint8_t> expected_anonymous{0x04, 0x01, 0xFF, 0xFF, 0x0A, 0x01, 0x02, 0x03, 0x00};
    assert(anonymous.bytes() == expected_anonymous);
    std::cout << "  Request layout test passed!\n";
}

void test_user_id_with_nul_rejected() {
    std::cout << "\n=== Testing NUL In User Id ===\n";

    bool threw = false;
    try {
        Socks4Request request(Ipv4Address{127, 0, 0, 1}, 80, std::string("a\0b", 3));
    } catch (const std::invalid_argument&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  NUL user id test passed!\n";
}

void test_status_classification() {
    std::cout << "\n=== Testing Status Classification ===\n";

    assert(classify_socks4_status(0x5B) == ProxyErrorKind::Rejected);
    assert(classify_socks4_status(0x5C) == ProxyErrorKind::IdentdUnreachable);
    assert(classify_socks4_status(0x5D) == ProxyErrorKind::IdentdMismatch);
    assert(classify_socks4_status(0x00) == ProxyErrorKind::Unknown);
    assert(classify_socks4_status(0xFF) == ProxyErrorKind::Unknown);

    auto err = make_socks4_error(0x5C);
    assert(err.kind() == ProxyErrorKind::IdentdUnreachable);
    assert(err.status() == 0x5C);
    std::string what = err.what();
    std::cout << "  " << what << "\n";
    assert(what.find("0x5C") != std::string::npos);

    std::array<uint8_t, socks4::response_size> granted{0x00, 0x5A, 0, 0, 0, 0, 0, 0};
    assert(Socks4Response(granted).granted());
    std::array<uint8_t, socks4::response_size> refused{0x00, 0x5B, 0, 0, 0, 0, 0, 0};
    Socks4Response r(refused);
    assert(!r.granted());
    assert(r.status() == 0x5B);
    std::cout << "  Status classification test passed!\n";
}

void test_host_resolution() {
    std::cout << "\n=== Testing IPv4 Resolution ===\n";

    std::error_code ec;
    auto literal = resolve_ipv4("203.0.113.5", ec);
    assert(literal && !ec);
    assert(to_string(*literal) == "203.0.113.5");

    auto local = resolve_ipv4("localhost", ec);
    assert(local && !ec);
    assert((*local)[0] == 127);

    auto empty = resolve_ipv4("", ec);
    assert(!empty && ec);

    auto bogus = resolve_ipv4("no-such-host.invalid", ec);
    assert(!bogus && ec);
    std::cout << "  unresolvable host: " << ec.message() << "\n";
    std::cout << "  Resolution test passed!\n";
}

void test_endpoint_resolution_both_families() {
    std::cout << "\n=== Testing Dual-Stack Endpoint Resolution ===\n";

    std::error_code ec;
    auto v4 = resolve_endpoint("127.0.0.1", 4242, ec);
    assert(v4 && !ec);
    assert(v4->family == AF_INET);
    assert(format_endpoint(v4->address) == "127.0.0.1:4242");

    auto v6 = resolve_endpoint("::1", 6667, ec);
    assert(v6 && !ec);
    assert(v6->family == AF_INET6);
    assert(format_endpoint(v6->address) == "[::1]:6667");

    // SOCKS4 carries IPv4 only
    auto proxy_target = resolve_ipv4("::1", ec);
    assert(!proxy_target && ec);

    auto empty = resolve_endpoint("", 80, ec);
    assert(!empty && ec);
    std::cout << "  Dual-stack resolution test passed!\n";
}

} // namespace

int main() {
    std::cout << "SOCKS4 Tests\n";
    std::cout << "============\n";

    test_request_layout();
    test_user_id_with_nul_rejected();
    test_status_classification();
    test_host_resolution();
    test_endpoint_resolution_both_families();

    std::cout << "\n============\n";
    std::cout << "All SOCKS4 tests passed!\n";
    return 0;
}
