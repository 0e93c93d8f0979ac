/**
 * \file TcpSocket.cpp
 * \brief POSIX TCP stream socket.
 * \ingroup socket_backend
 */
#include "TcpSocket.hpp"
#include "logger.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <stdexcept>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

constexpr auto kWaitSlice = std::chrono::milliseconds(100);

bool set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return ::fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

bool is_would_block(int err) {
    return err == EAGAIN || err == EWOULDBLOCK || err == EINTR;
}

// IPv4 resolution; the bus is a local transport.
bool resolve_ipv4(const std::string& host, int port, bool passive, sockaddr_in& out, std::error_code& error) {
    std::memset(&out, 0, sizeof(out));
    out.sin_family = AF_INET;
    out.sin_port = htons(static_cast<uint16_t>(port));
    const std::string h = host.empty() ? (passive ? "0.0.0.0" : "127.0.0.1") : host;
    if (::inet_pton(AF_INET, h.c_str(), &out.sin_addr) == 1) return true;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;
    addrinfo* res = nullptr;
    int rc = ::getaddrinfo(h.c_str(), nullptr, &hints, &res);
    if (rc != 0 || !res) {
        error = std::make_error_code(std::errc::address_not_available);
        return false;
    }
    out.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    ::freeaddrinfo(res);
    return true;
}

std::string format_endpoint(const sockaddr_in& addr) {
    char ip[INET_ADDRSTRLEN] = {0};
    ::inet_ntop(AF_INET, &addr.sin_addr, ip, sizeof(ip));
    return std::string(ip) + ":" + std::to_string(ntohs(addr.sin_port));
}

} // namespace

TcpSocket::TcpSocket(std::shared_ptr<Logger> logger) : logger_(std::move(logger)) {}

TcpSocket::TcpSocket(int existing_fd, std::shared_ptr<Logger> logger)
    : fd_(existing_fd), logger_(std::move(logger)) {
    if (fd_ < 0) {
        throw std::invalid_argument("TcpSocket: invalid socket descriptor");
    }
    set_nonblocking(fd_);
    set_no_delay(true);
}

TcpSocket::~TcpSocket() {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    close_locked(false);
}

std::shared_ptr<TcpSocket> TcpSocket::create(std::shared_ptr<Logger> logger) {
    return std::make_shared<TcpSocket>(std::move(logger));
}

std::error_code TcpSocket::last_os_error() {
    return std::error_code(errno, std::system_category());
}

bool TcpSocket::start_listening(const std::string& host, int port, int backlog, std::error_code& error) {
    error.clear();
    sockaddr_in addr{};
    if (!resolve_ipv4(host, port, true, addr, error)) return false;

    std::lock_guard<std::mutex> lk(fd_mutex_);
    close_locked(false);
    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        error = last_os_error();
        return false;
    }
    int yes = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));
    if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        error = last_os_error();
        ::close(fd);
        if (logger_) logger_->error("TcpSocket: bind " + host + ":" + std::to_string(port) + " failed: " + error.message());
        return false;
    }
    if (::listen(fd, backlog > 0 ? backlog : SOMAXCONN) != 0) {
        error = last_os_error();
        ::close(fd);
        if (logger_) logger_->error("TcpSocket: listen failed: " + error.message());
        return false;
    }
    set_nonblocking(fd);
    fd_ = fd;
    shutdown_requested_ = false;
    return true;
}

std::shared_ptr<IAsyncStream> TcpSocket::try_accept(std::error_code& error) {
    error.clear();
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return nullptr;
    }
    int client = ::accept4(fd_, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (client < 0) {
        int err = errno;
        if (is_would_block(err) || err == ECONNABORTED || err == EPROTO) return nullptr;
        error = std::error_code(err, std::system_category());
        return nullptr;
    }
    return std::make_shared<TcpSocket>(client, logger_);
}

std::shared_ptr<IAsyncStream> TcpSocket::blocking_accept(std::error_code& error, std::chrono::milliseconds timeout) {
    error.clear();
    int fd;
    {
        std::lock_guard<std::mutex> lk(fd_mutex_);
        fd = fd_;
    }
    if (fd < 0 || shutdown_requested_) return nullptr;
    pollfd pfd{fd, POLLIN, 0};
    int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (rc <= 0) {
        if (rc < 0 && errno != EINTR) error = last_os_error();
        return nullptr;
    }
    auto client = try_accept(error);
    if (!client && error == std::errc::bad_file_descriptor) error.clear();
    return client;
}

void TcpSocket::connect(const std::string& host, int port, std::error_code& error, std::chrono::milliseconds timeout) {
    error.clear();
    sockaddr_in addr{};
    if (!resolve_ipv4(host, port, false, addr, error)) return;

    int fd = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC | SOCK_NONBLOCK, 0);
    if (fd < 0) {
        error = last_os_error();
        return;
    }
    if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
        if (errno != EINPROGRESS) {
            error = last_os_error();
            ::close(fd);
            return;
        }
        pollfd pfd{fd, POLLOUT, 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(timeout.count()));
        if (rc == 0) {
            error = std::make_error_code(std::errc::timed_out);
            ::close(fd);
            return;
        }
        if (rc < 0) {
            error = last_os_error();
            ::close(fd);
            return;
        }
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        ::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len);
        if (so_error != 0) {
            error = std::error_code(so_error, std::system_category());
            ::close(fd);
            return;
        }
    }
    {
        std::lock_guard<std::mutex> lk(fd_mutex_);
        close_locked(false);
        fd_ = fd;
        shutdown_requested_ = false;
    }
    set_no_delay(true);
}

bool TcpSocket::try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) {
    bytes_read = 0;
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t n = ::recv(fd_, buffer, size, MSG_DONTWAIT);
    if (n > 0) {
        bytes_read = static_cast<size_t>(n);
        error.clear();
        return true;
    }
    if (n == 0) {
        error = std::make_error_code(std::errc::not_connected);
        return true;
    }
    int err = errno;
    if (is_would_block(err)) {
        if (shutdown_requested_) {
            error = std::make_error_code(std::errc::not_connected);
            return true;
        }
        return false;
    }
    error = std::error_code(err, std::system_category());
    return true;
}

bool TcpSocket::try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) {
    bytes_written = 0;
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return true;
    }
    ssize_t n = ::send(fd_, buffer, size, MSG_DONTWAIT | MSG_NOSIGNAL);
    if (n >= 0) {
        bytes_written = static_cast<size_t>(n);
        error.clear();
        return true;
    }
    int err = errno;
    if (is_would_block(err)) return false;
    error = std::error_code(err, std::system_category());
    return true;
}

bool TcpSocket::wait_ready(WaitFor what, std::chrono::steady_clock::time_point deadline, std::error_code& error) {
    while (true) {
        if (shutdown_requested_) {
            error = std::make_error_code(std::errc::not_connected);
            return false;
        }
        int fd;
        {
            std::lock_guard<std::mutex> lk(fd_mutex_);
            fd = fd_;
        }
        if (fd < 0) {
            error = std::make_error_code(std::errc::bad_file_descriptor);
            return false;
        }
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) {
            error = std::make_error_code(std::errc::timed_out);
            return false;
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        auto slice = std::max(std::chrono::milliseconds(1), std::min(remaining, kWaitSlice));
        pollfd pfd{fd, static_cast<short>(what == WaitFor::Read ? POLLIN : POLLOUT), 0};
        int rc = ::poll(&pfd, 1, static_cast<int>(slice.count()));
        if (rc > 0) return true;
        if (rc < 0 && errno != EINTR) {
            error = last_os_error();
            return false;
        }
    }
}

void TcpSocket::read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error,
                     std::chrono::milliseconds timeout) {
    error.clear();
    bytes_read = 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (true) {
        if (try_read(buffer, size, bytes_read, error)) return;
        if (!wait_ready(WaitFor::Read, deadline, error)) return;
    }
}

void TcpSocket::write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error,
                      std::chrono::milliseconds timeout) {
    error.clear();
    bytes_written = 0;
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    const auto* bytes = static_cast<const uint8_t*>(buffer);
    while (bytes_written < size) {
        size_t n = 0;
        if (try_write(bytes + bytes_written, size - bytes_written, n, error)) {
            if (error) return;
            bytes_written += n;
            continue;
        }
        if (!wait_ready(WaitFor::Write, deadline, error)) return;
    }
}

void TcpSocket::close_locked(bool reset) {
    if (fd_ < 0) return;
    if (reset) {
        linger lg{1, 0};
        ::setsockopt(fd_, SOL_SOCKET, SO_LINGER, &lg, sizeof(lg));
    }
    ::close(fd_);
    fd_ = -1;
}

void TcpSocket::close() {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    close_locked(false);
}

void TcpSocket::abort() {
    shutdown_requested_ = true;
    std::lock_guard<std::mutex> lk(fd_mutex_);
    close_locked(true);
}

void TcpSocket::shutdown() {
    shutdown_requested_ = true;
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

bool TcpSocket::is_open() const {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    return fd_ >= 0;
}

int TcpSocket::get_handle() const {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    return fd_;
}

std::string TcpSocket::local_endpoint() const {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) return "";
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return "";
    return format_endpoint(addr);
}

std::string TcpSocket::remote_endpoint() const {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) return "";
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return "";
    return format_endpoint(addr);
}

int TcpSocket::local_port() const {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) return 0;
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return 0;
    return ntohs(addr.sin_port);
}

bool TcpSocket::set_no_delay(bool enable) {
    std::lock_guard<std::mutex> lk(fd_mutex_);
    if (fd_ < 0) return false;
    int flag = enable ? 1 : 0;
    return ::setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &flag, sizeof(flag)) == 0;
}
