/**
 * \file TcpSocket.hpp
 * \brief POSIX TCP implementation of IAsyncStream and IBlockingStream.
 * \ingroup socket_backend
 * \details Descriptors are always non-blocking; the blocking role is layered on top with
 * `poll()` so both roles can share one connected socket. Descriptor access is serialized
 * so `close()` / `abort()` from another thread never races a send or recv.
 */
#pragma once

#include "transport/socket/IAsyncStream.hpp"
#include "transport/socket/IBlockingStream.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>

class Logger;

/** \brief TCP stream implementing both async and blocking roles.
 *  \ingroup socket_backend
 */
class TcpSocket : public virtual IAsyncStream, public virtual IBlockingStream {
public:
    explicit TcpSocket(std::shared_ptr<Logger> logger = nullptr);
    /** \brief Wrap an accepted descriptor (takes ownership). */
    TcpSocket(int existing_fd, std::shared_ptr<Logger> logger);
    ~TcpSocket() override;

    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // === Server role ===
    bool start_listening(const std::string& host, int port, int backlog, std::error_code& error) override;
    std::shared_ptr<IAsyncStream> try_accept(std::error_code& error) override;
    /** \brief `poll()`-based timed accept; see IServerSocket::blocking_accept for semantics. */
    std::shared_ptr<IAsyncStream> blocking_accept(std::error_code& error,
                                                  std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) override;

    // === Client role ===
    void connect(const std::string& host, int port, std::error_code& error,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) override;

    // === Non-blocking I/O ===
    bool try_read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error) override;
    bool try_write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error) override;

    // === Blocking I/O ===
    void read(void* buffer, size_t size, size_t& bytes_read, std::error_code& error,
              std::chrono::milliseconds timeout) override;
    void write(const void* buffer, size_t size, size_t& bytes_written, std::error_code& error,
               std::chrono::milliseconds timeout) override;

    // === Teardown ===
    void close() override;
    /** \brief Zero-linger close so the peer observes a connection reset. */
    void abort() override;
    /** \brief `shutdown(SHUT_RDWR)`: pending reads complete with `not_connected`. */
    void shutdown() override;

    // === Status ===
    bool is_open() const override;
    int get_handle() const override;
    std::string local_endpoint() const override;
    std::string remote_endpoint() const override;
    int local_port() const override;
    std::string socket_type() const override { return "tcp"; }

    /** \brief Toggle TCP_NODELAY; enabled by default on connected sockets. */
    bool set_no_delay(bool enable);

    static std::shared_ptr<TcpSocket> create(std::shared_ptr<Logger> logger = nullptr);

private:
    enum class WaitFor { Read, Write };
    /** \brief Wait for readiness in short slices so `shutdown()` and deadlines are observed. */
    bool wait_ready(WaitFor what, std::chrono::steady_clock::time_point deadline, std::error_code& error);
    void close_locked(bool reset);
    static std::error_code last_os_error();

    int fd_{-1};
    mutable std::mutex fd_mutex_;
    std::atomic<bool> shutdown_requested_{false};
    std::shared_ptr<Logger> logger_;
};
