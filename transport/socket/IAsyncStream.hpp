/**
 * \file IAsyncStream.hpp
 * \brief Non-blocking stream role combining client and acceptor capabilities.
 * \ingroup socket_backend
 * \see IClientSocket \see IServerSocket
 */
#pragma once

#include <cstddef>
#include <system_error>
#include "IClientSocket.hpp"
#include "IServerSocket.hpp"

/** \brief Async stream interface consumed by `transport::CoroSocketAdapter`.
 *  \ingroup socket_backend
 */
struct IAsyncStream : public virtual IClientSocket, public virtual IServerSocket {
    /** \brief Non-blocking read; false means would-block, true means done (data or error).
     *  \details An orderly peer close completes with `errc::not_connected`.
     */
    virtual bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) = 0;
    /** \brief Non-blocking write; false means would-block, true means done (partial write or error). */
    virtual bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) = 0;
};
