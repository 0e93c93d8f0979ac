#include "TcpHttpTransport.hpp"
#include "transport/socket/SocketFactory.hpp"
#include "transport/socket/IBlockingStream.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace http {

namespace {

std::string lower(std::string_view s) {
    std::string out(s);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) s.remove_prefix(1);
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) s.remove_suffix(1);
    return s;
}

bool parse_number(std::string_view text, std::size_t& value, int base) {
    text = trim(text);
    if (text.empty()) return false;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, base);
    return ec == std::errc() && ptr == text.data() + text.size();
}

ParseStatus decode_chunked(std::string_view in, std::string& out, std::string& error) {
    out.clear();
    std::size_t pos = 0;
    while (true) {
        const auto line_end = in.find("\r\n", pos);
        if (line_end == std::string_view::npos) return ParseStatus::Incomplete;
        auto size_text = in.substr(pos, line_end - pos);
        if (auto semi = size_text.find(';'); semi != std::string_view::npos) size_text = size_text.substr(0, semi);
        std::size_t chunk = 0;
        if (!parse_number(size_text, chunk, 16)) {
            error = "bad chunk size '" + std::string(size_text) + "'";
            return ParseStatus::Invalid;
        }
        const auto data_start = line_end + 2;
        if (chunk == 0) {
            // Optional trailer lines, then the terminating empty line
            auto p = data_start;
            while (true) {
                const auto next = in.find("\r\n", p);
                if (next == std::string_view::npos) return ParseStatus::Incomplete;
                if (next == p) return ParseStatus::Complete;
                p = next + 2;
            }
        }
        if (in.size() < data_start + chunk + 2) return ParseStatus::Incomplete;
        if (in.substr(data_start + chunk, 2) != "\r\n") {
            error = "chunk not terminated by CRLF";
            return ParseStatus::Invalid;
        }
        out.append(in.substr(data_start, chunk));
        pos = data_start + chunk + 2;
    }
}

} // namespace

ParseStatus parse_response(std::string_view raw, bool eof, HttpResponse& out, std::string& error) {
    const auto head_end = raw.find("\r\n\r\n");
    if (head_end == std::string_view::npos) {
        if (eof) {
            error = raw.empty() ? "empty response" : "connection closed inside the header";
            return ParseStatus::Invalid;
        }
        return ParseStatus::Incomplete;
    }

    const auto head = raw.substr(0, head_end);
    const auto status_end = std::min(head.find("\r\n"), head.size());
    const auto status_line = head.substr(0, status_end);
    if (status_line.rfind("HTTP/", 0) != 0) {
        error = "not an HTTP response";
        return ParseStatus::Invalid;
    }
    const auto sp1 = status_line.find(' ');
    if (sp1 == std::string_view::npos) {
        error = "malformed status line";
        return ParseStatus::Invalid;
    }
    auto rest = status_line.substr(sp1 + 1);
    const auto sp2 = rest.find(' ');
    std::size_t code = 0;
    if (!parse_number(rest.substr(0, sp2), code, 10) || code < 100 || code > 999) {
        error = "malformed status code";
        return ParseStatus::Invalid;
    }
    out.status = static_cast<int>(code);
    out.reason = sp2 == std::string_view::npos ? std::string() : std::string(rest.substr(sp2 + 1));

    out.headers.clear();
    std::size_t pos = status_end;
    while (pos < head.size()) {
        pos += 2;
        auto line_end = head.find("\r\n", pos);
        if (line_end == std::string_view::npos) line_end = head.size();
        const auto line = head.substr(pos, line_end - pos);
        const auto colon = line.find(':');
        if (colon != std::string_view::npos) {
            out.headers[lower(trim(line.substr(0, colon)))] = std::string(trim(line.substr(colon + 1)));
        }
        pos = line_end;
    }

    const auto body = raw.substr(head_end + 4);
    if (out.status < 200 || out.status == 204 || out.status == 304) {
        out.body.clear();
        return ParseStatus::Complete;
    }

    if (auto te = out.headers.find("transfer-encoding");
        te != out.headers.end() && lower(te->second).find("chunked") != std::string::npos) {
        auto st = decode_chunked(body, out.body, error);
        if (st == ParseStatus::Incomplete && eof) {
            error = "connection closed inside a chunked body";
            return ParseStatus::Invalid;
        }
        return st;
    }

    if (auto cl = out.headers.find("content-length"); cl != out.headers.end()) {
        std::size_t length = 0;
        if (!parse_number(cl->second, length, 10)) {
            error = "bad Content-Length '" + cl->second + "'";
            return ParseStatus::Invalid;
        }
        if (body.size() >= length) {
            out.body.assign(body.substr(0, length));
            return ParseStatus::Complete;
        }
        if (eof) {
            error = "body truncated at " + std::to_string(body.size()) + " of " + std::to_string(length) + " bytes";
            return ParseStatus::Invalid;
        }
        return ParseStatus::Incomplete;
    }

    if (eof) {
        out.body.assign(body);
        return ParseStatus::Complete;
    }
    return ParseStatus::Incomplete;
}

TcpHttpTransport::TcpHttpTransport(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger)) {}

std::string TcpHttpTransport::format_request(const HttpRequest& request) {
    std::string wire;
    wire.reserve(256 + request.body.size());
    wire += to_string(request.method);
    wire += ' ';
    wire += request.target.empty() ? "/" : request.target;
    wire += " HTTP/1.1\r\nHost: " + request.host + ":" + std::to_string(request.port) + "\r\n";
    for (const auto& [name, value] : request.headers) {
        wire += name + ": " + value + "\r\n";
    }
    if (!request.body.empty() || request.method == HttpMethod::Post || request.method == HttpMethod::Put) {
        wire += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    }
    wire += "\r\n";
    wire += request.body;
    return wire;
}

HttpResponse TcpHttpTransport::perform(const HttpRequest& request, std::chrono::milliseconds timeout,
                                       std::error_code& error) {
    error.clear();
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    auto remaining = [&]() {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds(0);
    };

    HttpResponse response;
    auto socket = transport::SocketFactory::create_blocking_client(logger_);
    socket->connect(request.host, request.port, error, timeout);
    if (error) {
        return response;
    }

    const auto wire = format_request(request);
    std::size_t written = 0;
    socket->write(wire.data(), wire.size(), written, error, remaining());
    if (error) {
        socket->close();
        return response;
    }

    std::string raw;
    char buf[4096];
    while (true) {
        const auto left = remaining();
        if (left.count() == 0) {
            error = std::make_error_code(std::errc::timed_out);
            break;
        }
        std::size_t n = 0;
        std::error_code rec;
        socket->read(buf, sizeof(buf), n, rec, left);
        bool eof = false;
        if (rec == std::errc::not_connected) {
            eof = true;
        } else if (rec) {
            error = rec;
            break;
        }
        raw.append(buf, n);

        std::string reason;
        const auto st = parse_response(raw, eof, response, reason);
        if (st == ParseStatus::Complete) break;
        if (st == ParseStatus::Invalid) {
            if (logger_) logger_->debug("HTTP: bad response from " + request.host + ":" +
                                        std::to_string(request.port) + ": " + reason);
            error = std::make_error_code(std::errc::protocol_error);
            break;
        }
    }
    socket->close();
    return response;
}

} // namespace http
