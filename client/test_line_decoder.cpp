/**
 * @file test_line_decoder.cpp
 * @brief Line splitting across arbitrary chunk boundaries.
 */

#include "LineDecoder.hpp"

#include <cassert>
#include <iostream>
#include <string>
#include <vector>

using client::LineDecoder;

namespace {

std::vector<std::string> feed_all(LineDecoder& decoder, const std::string& data) {
    std::vector<std::string> lines;
    decoder.feed(data.data(), data.size(), lines);
    return lines;
}

void test_basic_split() {
    std::cout << "\n=== Testing Basic Split ===\n";

    LineDecoder decoder;
    auto lines = feed_all(decoder, "alpha\nbeta\n\ngamma");
    assert(lines.size() == 3);
    assert(lines[0] == "alpha");
    assert(lines[1] == "beta");
    assert(lines[2].empty());
    assert(decoder.pending() == 5);

    std::string rest;
    assert(decoder.flush(rest));
    assert(rest == "gamma");
    assert(decoder.pending() == 0);
    assert(!decoder.flush(rest));
    std::cout << "  Basic split test passed!\n";
}

void test_crlf_handling() {
    std::cout << "\n=== Testing CRLF Handling ===\n";

    {
        LineDecoder decoder;
        auto lines = feed_all(decoder, "one\r\ntwo\r\n");
        assert(lines.size() == 2);
        assert(lines[0] == "one");
        assert(lines[1] == "two");
    }

    // CR and LF arriving in different chunks
    {
        LineDecoder decoder;
        auto first = feed_all(decoder, "split\r");
        assert(first.empty());
        auto second = feed_all(decoder, "\nnext\n");
        assert(second.size() == 2);
        assert(second[0] == "split");
        assert(second[1] == "next");
    }

    // A lone CR is data; only one CR before LF is dropped
    {
        LineDecoder decoder;
        auto lines = feed_all(decoder, "a\rb\nc\r\r\n");
        assert(lines.size() == 2);
        assert(lines[0] == "a\rb");
        assert(lines[1] == "c\r");
    }
    std::cout << "  CRLF handling test passed!\n";
}

void test_byte_at_a_time() {
    std::cout << "\n=== Testing Byte-At-A-Time Feed ===\n";

    const std::string wire = "first line\nsecond\r\nthird";
    LineDecoder decoder;
    std::vector<std::string> lines;
    for (char c : wire) {
        decoder.feed(&c, 1, lines);
    }
    assert(lines.size() == 2);
    assert(lines[0] == "first line");
    assert(lines[1] == "second");
    std::string rest;
    assert(decoder.flush(rest) && rest == "third");

    // Bytes pass through unchanged, including UTF-8 and NUL
    LineDecoder binary;
    std::string payload("caf\xC3\xA9\0x\n", 8);
    auto out = feed_all(binary, payload);
    assert(out.size() == 1);
    assert(out[0] == std::string("caf\xC3\xA9\0x", 7));
    std::cout << "  Byte-at-a-time test passed!\n";
}

} // namespace

int main() {
    std::cout << "LineDecoder Tests\n";
    std::cout << "=================\n";

    test_basic_split();
    test_crlf_handling();
    test_byte_at_a_time();

    std::cout << "\n=================\n";
    std::cout << "All LineDecoder tests passed!\n";
    return 0;
}
