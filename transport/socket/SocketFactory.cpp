/**
 * \file SocketFactory.cpp
 * \brief Backend construction for role-based sockets.
 * \ingroup socket_backend
 */
#include "SocketFactory.hpp"
#include "IAsyncStream.hpp"
#include "IBlockingStream.hpp"
#include "tcp/TcpSocket.hpp"

#include <stdexcept>

namespace transport {

void SocketFactory::set_default_socket_type(SocketType type) noexcept { default_type_ = type; }
SocketType SocketFactory::get_default_socket_type() noexcept { return default_type_; }

std::shared_ptr<IAsyncStream> SocketFactory::create_async_server(std::shared_ptr<Logger> logger) {
    switch (default_type_) {
        case SocketType::Tcp:
            return TcpSocket::create(std::move(logger));
        default:
            throw std::invalid_argument("Unsupported socket type for SocketFactory async server");
    }
}

std::shared_ptr<IAsyncStream> SocketFactory::create_async_client(std::shared_ptr<Logger> logger) {
    switch (default_type_) {
        case SocketType::Tcp:
            return TcpSocket::create(std::move(logger));
        default:
            throw std::invalid_argument("Unsupported socket type for SocketFactory async client");
    }
}

std::shared_ptr<IBlockingStream> SocketFactory::create_blocking_client(std::shared_ptr<Logger> logger) {
    switch (default_type_) {
        case SocketType::Tcp:
            return TcpSocket::create(std::move(logger));
        default:
            throw std::invalid_argument("Unsupported socket type for SocketFactory blocking client");
    }
}

} // namespace transport
