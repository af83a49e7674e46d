/**
 * \file IAsyncStream.hpp
 * \brief Non-blocking duplex stream interface.
 * \ingroup socket_backend
 * \details Aggregates non-blocking read/write with the client connect role.
 * The read half and the write half are independent: one `try_read` and one
 * `try_write` may run concurrently on different threads, but two calls on the
 * same half must not overlap.
 * \see IClientSocket
 */
#pragma once

#include <cstddef>
#include <system_error>
#include "IClientSocket.hpp"

/** \brief Unified async stream interface.
 *  \ingroup socket_backend
 */
struct IAsyncStream : public virtual IClientSocket {
    /** \brief Attempt non-blocking read; returns true when completed (success, end-of-stream or error).
     *  \details End-of-stream is reported as completion with `bytes_read == 0` and no error.
     */
    virtual bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) = 0;
    /** \brief Attempt non-blocking write; returns true when completed (success or error). May write partially. */
    virtual bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) = 0;
};
