/**
 * \file SocketFactory.cpp
 * \brief Backend dispatch for role-based socket creation.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "IAsyncStream.hpp"
#include "bsd/BsdSocket.hpp"

namespace transport {

std::shared_ptr<IAsyncStream> SocketFactory::create_async_client(std::shared_ptr<Logger> logger, SocketType type) {
    switch (type) {
        case SocketType::Bsd:
            return BsdSocket::create(std::move(logger));
    }
    return nullptr;
}

} // namespace transport
