/**
 * \file IClientSocket.hpp
 * \brief Outbound connection role.
 * \ingroup socket_backend
 */
#pragma once

#include <chrono>
#include <string>
#include <system_error>
#include "ISocketLifecycle.hpp"

/** \brief Client socket role interface.
 *  \ingroup socket_backend
 */
struct IClientSocket : public virtual ISocketLifecycle {
    /** \brief Connect within `timeout`; sets `error` on failure and never throws. */
    virtual void connect(const std::string& host, int port, std::error_code& error,
                         std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) = 0;
};
