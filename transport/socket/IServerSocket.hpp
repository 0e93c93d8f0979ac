/**
 * \file IServerSocket.hpp
 * \brief Listening/acceptor role.
 * \ingroup socket_backend
 * \see IAsyncStream
 */
#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <system_error>
#include <thread>
#include "ISocketLifecycle.hpp"

struct IAsyncStream; // fwd

/** \brief Server role interface (bind + listen + accept).
 *  \ingroup socket_backend
 */
struct IServerSocket : public virtual ISocketLifecycle {
    /** \brief Bind `host:port` and listen.
     *  \details Port 0 asks the OS for an ephemeral port; query it with `local_port()`.
     *  \param error Receives the OS error of the failing step (socket, bind or listen).
     *  \return true on success.
     */
    virtual bool start_listening(const std::string& host, int port, int backlog, std::error_code& error) = 0;

    /** \brief Non-blocking accept; nullptr with `error` clear when no client is pending. */
    virtual std::shared_ptr<IAsyncStream> try_accept(std::error_code& error) = 0;

    /** \brief Timed accept for dedicated acceptor threads.
     *  \details Returns nullptr with `error` cleared on timeout or transient conditions so the
     *  caller can re-check its own shutdown flag; `error` is set only on non-transient failure.
     *  The default polls `try_accept` in 5 ms slices; backends with readiness APIs override it.
     */
    virtual std::shared_ptr<IAsyncStream> blocking_accept(std::error_code& error,
                                                          std::chrono::milliseconds timeout = std::chrono::milliseconds(500)) {
        error.clear();
        const auto slice = std::chrono::milliseconds(5);
        auto elapsed = std::chrono::milliseconds(0);
        while (elapsed < timeout) {
            auto client = try_accept(error);
            if (client || error) return client;
            std::this_thread::sleep_for(slice);
            elapsed += slice;
        }
        error.clear();
        return nullptr;
    }
};
