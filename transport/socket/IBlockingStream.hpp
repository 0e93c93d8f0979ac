/**
 * \file IBlockingStream.hpp
 * \brief Blocking read/write role used outside the coroutine loop.
 * \ingroup socket_backend
 * \details The bus writes through this role from arbitrary threads while the session
 * coroutine keeps the async read side; peers and the HTTP client use it exclusively.
 */
#pragma once

#include <chrono>
#include <cstddef>
#include <system_error>
#include "IClientSocket.hpp"

/** \brief Blocking stream role interface.
 *  \ingroup socket_backend
 */
struct IBlockingStream : public virtual IClientSocket {
    /** \brief Read at least one byte (up to `size`) or fail; a timeout yields `errc::timed_out`. */
    virtual void read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error,
                      std::chrono::milliseconds timeout) = 0;
    /** \brief Write all `size` bytes or fail; a timeout yields `errc::timed_out`. */
    virtual void write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error,
                       std::chrono::milliseconds timeout) = 0;
};
