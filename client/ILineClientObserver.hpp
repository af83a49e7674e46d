/**
 * \file ILineClientObserver.hpp
 * \brief Event sink for LineClient notifications.
 * \ingroup client_module
 */
#pragma once

#include <string>

namespace client {

/** \brief Receives line-client events.
 *  \details Both callbacks run on an event-loop thread. Implementations may call
 *  `LineClient::send()` or `LineClient::disconnect()` but must not wait on a send
 *  future or destroy the client from inside a callback.
 */
class ILineClientObserver {
public:
    virtual ~ILineClientObserver() = default;

    /** \brief One complete incoming line, terminator stripped. */
    virtual void on_message_received(const std::string& message) = 0;

    /** \brief The connection is gone. Fires at most once per client. */
    virtual void on_connection_closed() = 0;
};

} // namespace client
