/**
 * \file SocketFactory.hpp
 * \brief Factory helpers for creating role-based socket implementations.
 * \ingroup socket_backend
 * \details Centralizes backend resolution and construction.
 * \see IAsyncStream
 */
#pragma once

#include <memory>
#include "logger.hpp"

struct IAsyncStream;

namespace transport {

/** \brief Supported socket backend types for factory resolution. */
enum class SocketType
{
    Bsd
};

/** \brief Static factory for creating role-based socket implementations.
 *  \ingroup socket_backend
 *  \details Ensures consistent backend selection and optional logger propagation.
 */
class SocketFactory {
public:
    /** \brief Create an async client stream with optional logger injection. */
    static std::shared_ptr<IAsyncStream> create_async_client(std::shared_ptr<Logger> logger,
                                                             SocketType type = SocketType::Bsd);

private:
    // Static-only: prevent instantiation
    SocketFactory() = delete;
};

} // namespace transport
