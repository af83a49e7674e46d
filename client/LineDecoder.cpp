/**
 * \file LineDecoder.cpp
 * \brief Line splitting with CRLF tolerance.
 * \ingroup client_module
 */
#include "LineDecoder.hpp"

#include <cstring>

namespace client {

size_t LineDecoder::feed(const char* data, size_t size, std::vector<std::string>& lines) {
    size_t produced = 0;
    const char* cursor = data;
    const char* end = data + size;
    while (cursor < end) {
        const void* hit = std::memchr(cursor, '\n', static_cast<size_t>(end - cursor));
        if (!hit) {
            partial_.append(cursor, end);
            break;
        }
        const char* nl = static_cast<const char*>(hit);
        partial_.append(cursor, nl);
        if (!partial_.empty() && partial_.back() == '\r') {
            partial_.pop_back();
        }
        lines.push_back(std::move(partial_));
        partial_.clear();
        ++produced;
        cursor = nl + 1;
    }
    return produced;
}

bool LineDecoder::flush(std::string& line) {
    if (partial_.empty()) return false;
    line = std::move(partial_);
    partial_.clear();
    return true;
}

} // namespace client
