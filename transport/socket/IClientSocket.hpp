/**
 * \file IClientSocket.hpp
 * \brief Client connection interface.
 * \ingroup socket_backend
 * \details Connect is synchronous from the caller's point of view but must
 * observe the supplied stop token, so a caller-side cancellation aborts a
 * pending TCP handshake.
 */
#pragma once

#include <stop_token>
#include <string>
#include <system_error>
#include "ISocketLifecycle.hpp"

/** \brief Client socket role interface.
 *  \ingroup socket_backend
 */
struct IClientSocket : public virtual ISocketLifecycle {
    /** \brief Resolve `host` and establish a connection; sets `error` on failure (non-throwing).
     *  \details Sets `std::errc::operation_canceled` when `stop` is requested before completion.
     */
    virtual void connect(const std::string& host, int port, std::stop_token stop, std::error_code& error) = 0;
};
