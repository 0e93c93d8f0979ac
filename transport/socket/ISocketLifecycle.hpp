/**
 * \file ISocketLifecycle.hpp
 * \brief Lifecycle and endpoint queries shared by every socket role.
 * \ingroup socket_backend
 */
#pragma once

#include <string>

/** \brief Base interface for socket lifecycle and endpoint methods.
 *  \ingroup socket_backend
 */
struct ISocketLifecycle {
    virtual ~ISocketLifecycle() = default;

    /** \brief Close the descriptor with an orderly FIN. */
    virtual void close() = 0;
    /** \brief Close with an immediate RST (zero linger). Defaults to `close()`. */
    virtual void abort() { close(); }
    /** \brief Interrupt pending and blocking operations without releasing the descriptor. */
    virtual void shutdown() {}
    virtual bool is_open() const = 0;
    /** \brief Native descriptor, or -1 once closed. */
    virtual int get_handle() const = 0;
    /** \brief "ip:port" of the local side, empty if unbound. */
    virtual std::string local_endpoint() const = 0;
    /** \brief "ip:port" of the peer, empty if unconnected. */
    virtual std::string remote_endpoint() const = 0;
    /** \brief Locally bound port, 0 if unbound. */
    virtual int local_port() const { return 0; }
    /** \brief Backend identifier (e.g. "tcp"). */
    virtual std::string socket_type() const = 0;
};
