/**
 * \file BsdErrnoCompat.hpp
 * \brief errno helpers for the POSIX socket backend.
 * \ingroup socket_backend
 * \details Identifies would-block conditions, maps errno values to
 *  `std::error_code`, and stringifies errors for logs.
 */
#pragma once

#include <cerrno>
#include <cstring>
#include <string>
#include <system_error>

namespace BsdErrnoCompat {

/** \brief True for errno values meaning "try again later" on a non-blocking fd. */
inline bool is_would_block_errno(int err) {
#if defined(EWOULDBLOCK) && EWOULDBLOCK != EAGAIN
    if (err == EWOULDBLOCK) return true;
#endif
    return err == EAGAIN || err == EINTR;
}

/** \brief True for errno values meaning a non-blocking connect is still pending. */
inline bool is_connect_pending_errno(int err) {
    return err == EINPROGRESS || err == EALREADY || err == EINTR;
}

/** \brief Wrap an errno value as a generic-category error code, comparable with `std::errc`. */
inline std::error_code to_error_code(int err) {
    return std::error_code(err, std::generic_category());
}

/** \brief Human-readable errno text for logs. */
inline std::string errno_to_string(int err) {
    return std::string(std::strerror(err)) + " (errno " + std::to_string(err) + ")";
}

} // namespace BsdErrnoCompat
