/**
 * \file CoroSocketAdapter.hpp
 * \brief Adds C++20 awaitable read/write operations to an `IAsyncStream`.
 * \details Composition rather than inheritance: the adapter owns the stream, forwards
 * lifecycle calls and turns `try_read` / `try_write` into awaitables that suspend on the
 * owning `CoroIoContext` until the backend reports completion.
 */
#pragma once

#include "logger.hpp"
#include "coroIoContext.hpp"
#include "transport/socket/IAsyncStream.hpp"

#include <chrono>
#include <coroutine>
#include <cstdint>
#include <functional>
#include <memory>
#include <stdexcept>
#include <system_error>

namespace transport {

/** \defgroup coro_adapter Socket Adapter
 *  \ingroup coro_module
 *  \brief Awaitable socket operations wrapping IAsyncStream.
 */

/**
 * \brief Coroutine-aware wrapper adding awaitable operations to `IAsyncStream`.
 * \details
 * - Fast path: `await_ready()` attempts the non-blocking call and skips suspension on success.
 * - Slow path: the operation is registered with the context and resumed on a loop thread.
 * - Reads complete with however many bytes were available (at least one); callers loop for exact sizes.
 * - \invariant At most one in-flight operation per adapter instance.
 * \ingroup coro_adapter
 */
class CoroSocketAdapter : public std::enable_shared_from_this<CoroSocketAdapter> {
public:
    enum class OperationType { NONE, READ, READ_HEADER, WRITE };

    CoroSocketAdapter(std::shared_ptr<IAsyncStream> socket, std::shared_ptr<Logger> logger,
                      std::shared_ptr<CoroIoContext> ctx)
        : socket_(std::move(socket)), logger_(std::move(logger)), context_(std::move(ctx)) {
        if (!socket_ || !context_) {
            throw std::invalid_argument("CoroSocketAdapter: socket and context cannot be null");
        }
    }

    IAsyncStream* socket() { return socket_.get(); }
    const IAsyncStream* socket() const { return socket_.get(); }
    std::shared_ptr<IAsyncStream> socket_ptr() { return socket_; }
    std::shared_ptr<CoroIoContext> context() const { return context_; }

    bool start_listening(const std::string& host, int port, int backlog, std::error_code& error) {
        return socket_->start_listening(host, port, backlog, error);
    }
    void close() { socket_->close(); }
    /** \brief Close with a connection reset. */
    void abort() { socket_->abort(); }
    int local_port() const { return socket_->local_port(); }
    /** \brief Interrupt in-flight operations; the awaiting coroutine resumes with an error. */
    void shutdown() { socket_->shutdown(); }
    bool is_open() const { return socket_->is_open(); }
    std::string remote_endpoint() const { return socket_->remote_endpoint(); }
    std::string local_endpoint() const { return socket_->local_endpoint(); }

    /** \brief Timed blocking accept returning a wrapped client adapter on the same context. */
    std::shared_ptr<CoroSocketAdapter> blocking_accept(std::error_code& error,
                                                       std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) {
        error.clear();
        auto client_stream = socket_->blocking_accept(error, timeout);
        if (!client_stream) return nullptr;
        return std::make_shared<CoroSocketAdapter>(client_stream, logger_, context_);
    }

    /** \brief Awaitable shared by the three operation kinds. */
    struct IoAwaitable {
        std::shared_ptr<CoroSocketAdapter> adapter;
        OperationType op;
        CoroIoContext::PendingOpCategory category;
        const char* what;

        bool await_ready() noexcept {
            adapter->current_operation_ = op;
            return adapter->try_complete_current_operation();
        }
        void await_suspend(std::coroutine_handle<> handle) {
            adapter->suspended_handle_ = handle;
            adapter->context_->register_pending(category, [a = adapter]() {
                return a->try_complete_current_operation();
            }, handle);
        }
        size_t await_resume() {
            adapter->suspended_handle_ = {};
            if (adapter->last_error_) {
                throw std::system_error(adapter->last_error_, what);
            }
            return adapter->last_bytes_transferred_;
        }
    };

    /** \brief Read up to `size` bytes into `buffer`. */
    IoAwaitable async_read(void* buffer, size_t size) {
        read_buffer_ = buffer;
        read_size_ = size;
        return IoAwaitable{shared_from_this(), OperationType::READ, CoroIoContext::PendingOpCategory::Read,
                           "Async read operation failed"};
    }
    /** \brief Read up to `size` bytes of a fixed-size frame header (counted separately). */
    IoAwaitable async_read_header(void* buffer, size_t size) {
        read_buffer_ = buffer;
        read_size_ = size;
        return IoAwaitable{shared_from_this(), OperationType::READ_HEADER, CoroIoContext::PendingOpCategory::ReadHeader,
                           "Async read header operation failed"};
    }
    /** \brief Write up to `size` bytes from `buffer`. */
    IoAwaitable async_write(const void* buffer, size_t size) {
        write_buffer_ = buffer;
        write_size_ = size;
        return IoAwaitable{shared_from_this(), OperationType::WRITE, CoroIoContext::PendingOpCategory::Write,
                           "Async write operation failed"};
    }

    std::error_code get_last_error() const { return last_error_; }
    size_t get_last_bytes_transferred() const { return last_bytes_transferred_; }
    /** \brief Coroutine currently parked on this adapter (null when idle). */
    std::coroutine_handle<> get_suspended_coroutine() const { return suspended_handle_; }

    /** \brief Advance the active operation; true when finished (success or error). */
    bool try_complete_current_operation() {
        switch (current_operation_) {
            case OperationType::READ:
            case OperationType::READ_HEADER: {
                last_error_.clear();
                bool completed = socket_->try_read(read_buffer_, read_size_, last_bytes_transferred_, last_error_);
                if (completed) current_operation_ = OperationType::NONE;
                return completed;
            }
            case OperationType::WRITE: {
                last_error_.clear();
                bool completed = socket_->try_write(write_buffer_, write_size_, last_bytes_transferred_, last_error_);
                if (completed) current_operation_ = OperationType::NONE;
                return completed;
            }
            case OperationType::NONE:
            default:
                return true;
        }
    }

private:
    std::shared_ptr<IAsyncStream> socket_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<CoroIoContext> context_;
    std::coroutine_handle<> suspended_handle_{};
    OperationType current_operation_ = OperationType::NONE;
    std::error_code last_error_;
    size_t last_bytes_transferred_ = 0;
    void* read_buffer_ = nullptr;
    size_t read_size_ = 0;
    const void* write_buffer_ = nullptr;
    size_t write_size_ = 0;
};

} // namespace transport
