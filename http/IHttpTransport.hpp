/**
 * \file http/IHttpTransport.hpp
 * \brief Single-attempt HTTP exchange, injectable into HttpClient.
 * \ingroup http_module
 */
#pragma once

#include "HttpTypes.hpp"

#include <chrono>
#include <system_error>

namespace http {

struct IHttpTransport {
    virtual ~IHttpTransport() = default;

    /**
     * \brief Perform one request within `timeout`.
     * \param error Set on connect, I/O, timeout or framing failure; the returned
     *        response is then meaningless. Never throws.
     */
    virtual HttpResponse perform(const HttpRequest& request, std::chrono::milliseconds timeout,
                                 std::error_code& error) = 0;
};

} // namespace http
