/**
 * \file SocketFactory.hpp
 * \brief Factory helpers for creating role-based socket implementations.
 * \ingroup socket_backend
 * \details Centralizes backend construction so bus and HTTP code only see role interfaces.
 */

/** \defgroup socket_backend Socket Backend
 *  \brief Role-based socket interfaces and the POSIX TCP backend.
 */
#pragma once

#include <memory>
#include "logger.hpp"

struct IAsyncStream;
struct IBlockingStream;

namespace transport {

/** \brief Socket backends known to the factory. */
enum class SocketType
{
    Tcp
};

/** \brief Static factory for role-based sockets with optional logger injection.
 *  \ingroup socket_backend
 */
class SocketFactory {
public:
    static void set_default_socket_type(SocketType type) noexcept;
    static SocketType get_default_socket_type() noexcept;

    /** \brief Unbound stream ready for `start_listening`. */
    static std::shared_ptr<IAsyncStream> create_async_server(std::shared_ptr<Logger> logger);
    /** \brief Unconnected stream ready for `connect`. */
    static std::shared_ptr<IAsyncStream> create_async_client(std::shared_ptr<Logger> logger);
    /** \brief Unconnected stream used through the blocking role. */
    static std::shared_ptr<IBlockingStream> create_blocking_client(std::shared_ptr<Logger> logger);

private:
    SocketFactory() = delete;

    static inline SocketType default_type_ = SocketType::Tcp;
};

} // namespace transport
