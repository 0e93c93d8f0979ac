/**
 * \file http/TcpHttpTransport.hpp
 * \brief HTTP/1.1 over the project's TCP socket.
 * \ingroup http_module
 */
#pragma once

#include "IHttpTransport.hpp"
#include "logger.hpp"

#include <memory>
#include <string>
#include <string_view>

namespace http {

/**
 * \brief One connection per request (`Connection: close`).
 * \details Bodies are delimited by Content-Length, chunked transfer coding, or the
 * peer closing the connection. The socket is closed when the attempt ends,
 * including on timeout.
 */
class TcpHttpTransport : public IHttpTransport {
public:
    explicit TcpHttpTransport(std::shared_ptr<Logger> logger);

    HttpResponse perform(const HttpRequest& request, std::chrono::milliseconds timeout,
                         std::error_code& error) override;

    /** \brief Request line, headers and body as sent on the wire. */
    static std::string format_request(const HttpRequest& request);

private:
    std::shared_ptr<Logger> logger_;
};

enum class ParseStatus { Incomplete, Complete, Invalid };

/**
 * \brief Try to parse a buffered response.
 * \param eof True once the peer closed; a body without a length then ends here.
 * \param error Reason for `Invalid`.
 */
ParseStatus parse_response(std::string_view raw, bool eof, HttpResponse& out, std::string& error);

} // namespace http
