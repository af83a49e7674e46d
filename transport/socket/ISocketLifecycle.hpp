/**
 * \file ISocketLifecycle.hpp
 * \brief Common lifecycle and endpoint query interface for all socket roles.
 * \ingroup socket_backend
 * \details Provides handle, endpoint, and teardown operations shared by the
 * stream roles. Higher layers (the coroutine adapter, the line client) depend
 * on this for generic closure and endpoint reporting.
 */
#pragma once

#include <string>

/** \brief Base interface for common socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the underlying transport; subsequent operations fail with `bad_file_descriptor`.
     *  \details Safe to call more than once and concurrently with in-flight `try_*` calls.
     */
    virtual void close() noexcept = 0;
    /** \brief Request shutdown - interrupts a blocking connect in progress. */
    virtual void shutdown() noexcept {}
    /** \brief True if underlying transport is currently open. */
    virtual bool is_open() const = 0;
    /** \brief Backend/native handle (or -1 if not applicable). */
    virtual int get_handle() const = 0;
    /** \brief Local endpoint string representation. */
    virtual std::string local_endpoint() const = 0;
    /** \brief Remote endpoint string representation. */
    virtual std::string remote_endpoint() const = 0;
    /** \brief Transport/backend type identifier (e.g. bsd). */
    virtual std::string socket_type() const = 0;
};
