/**
 * \file LineDecoder.hpp
 * \brief Incremental splitter turning a byte stream into text lines.
 * \ingroup client_module
 */
#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace client {

/** \brief Accumulates bytes and yields complete lines.
 *  \details A line ends at `\n`; one `\r` right before it is dropped as well.
 *  A lone `\r` elsewhere is ordinary data. Bytes are passed through unchanged.
 */
class LineDecoder {
public:
    /** \brief Append `size` bytes; complete lines are appended to `lines` in order.
     *  \return Number of lines produced by this call.
     */
    size_t feed(const char* data, size_t size, std::vector<std::string>& lines);

    /** \brief Take the unterminated remainder, if any (used at end-of-stream). */
    bool flush(std::string& line);

    /** \brief Bytes buffered after the last terminator. */
    size_t pending() const noexcept { return partial_.size(); }

private:
    std::string partial_;
};

} // namespace client
