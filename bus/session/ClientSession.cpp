// ClientSession.cpp - per-connection reader coroutine and frame writer
#include "ClientSession.hpp"

#include <stdexcept>
#include <system_error>

/**
 * \file bus/session/ClientSession.cpp
 * \brief Implements the coroutine frame reader and the locked frame writer.
 * \ingroup bus_module
 */

namespace bus {

namespace {

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

ClientSession::ClientSession(std::shared_ptr<transport::CoroSocketAdapter> adapter,
                             std::string id,
                             const BusConfig& config,
                             std::shared_ptr<Logger> logger)
    : adapter_(std::move(adapter))
    , id_(std::move(id))
    , max_frame_body_(config.max_frame_body)
    , write_timeout_(config.write_timeout)
    , logger_(std::move(logger))
    , connected_at_(epoch_ms())
    , last_activity_(Clock::now().time_since_epoch().count()) {
    if (!adapter_ || !logger_) {
        throw std::invalid_argument("ClientSession: adapter and logger cannot be null");
    }
    writer_ = std::dynamic_pointer_cast<IBlockingStream>(adapter_->socket_ptr());
    if (!writer_) {
        throw std::invalid_argument("ClientSession: socket backend has no blocking write role");
    }
}

void ClientSession::run(FrameCallback on_data, CloseCallback on_close) {
    on_data_ = std::move(on_data);
    on_close_ = std::move(on_close);
    reader_ = std::make_unique<Task<void>>(read_loop());
    reader_started_.store(true);
}

bool ClientSession::is_done() const {
    return reader_started_.load() && reader_->done();
}

bool ClientSession::is_open() const {
    return !closing_.load() && adapter_->is_open();
}

std::string ClientSession::endpoint() const {
    auto ep = adapter_->remote_endpoint();
    return ep.empty() ? std::string("unknown") : ep;
}

ClientSession::Clock::time_point ClientSession::last_activity() const {
    return Clock::time_point(Clock::duration(last_activity_.load()));
}

void ClientSession::touch() {
    touch(Clock::now());
}

void ClientSession::touch(Clock::time_point when) {
    const auto value = when.time_since_epoch().count();
    auto current = last_activity_.load();
    while (value > current && !last_activity_.compare_exchange_weak(current, value)) {
    }
}

bool ClientSession::send_frame(const std::string& frame) {
    if (closing_.load()) return false;
    std::lock_guard<std::mutex> lk(write_mutex_);
    std::error_code ec;
    size_t written = 0;
    writer_->write(frame.data(), frame.size(), written, ec, write_timeout_);
    if (ec) {
        logger_->debug("Client " + id_ + ": write failed: " + ec.message());
        return false;
    }
    frames_sent_.fetch_add(1);
    return true;
}

bool ClientSession::send(const HostBus::Envelope& envelope) {
    return send_frame(HostBus::encode_frame(HostBus::FrameKind::Data, envelope.serialize()));
}

bool ClientSession::send_ping() {
    return send_frame(HostBus::encode_frame(HostBus::FrameKind::Ping));
}

void ClientSession::close() {
    if (closing_.exchange(true)) return;
    adapter_->shutdown();
}

void ClientSession::abort() {
    closing_.store(true);
    adapter_->abort();
}

Task<void> ClientSession::read_loop() {
    std::string reason = "peer closed the connection";
    try {
        while (!closing_.load()) {
            HostBus::FrameHeader header{};
            auto* header_bytes = reinterpret_cast<char*>(&header);
            size_t got = 0;
            while (got < sizeof(header)) {
                size_t n = co_await adapter_->async_read_header(header_bytes + got, sizeof(header) - got);
                if (n == 0) {
                    throw std::system_error(std::make_error_code(std::errc::not_connected), "empty read");
                }
                got += n;
            }

            std::string why;
            if (!HostBus::validate_frame_header(header, max_frame_body_, why)) {
                logger_->warning("Client " + id_ + ": protocol error, closing: " + why);
                reason = "protocol error: " + why;
                break;
            }

            std::string body(header.body_size, '\0');
            got = 0;
            while (got < body.size()) {
                size_t n = co_await adapter_->async_read(body.data() + got, body.size() - got);
                if (n == 0) {
                    throw std::system_error(std::make_error_code(std::errc::not_connected), "empty read");
                }
                got += n;
            }

            touch();
            frames_received_.fetch_add(1);

            switch (static_cast<HostBus::FrameKind>(header.kind)) {
                case HostBus::FrameKind::Ping:
                    send_frame(HostBus::encode_frame(HostBus::FrameKind::Pong));
                    break;
                case HostBus::FrameKind::Pong:
                    break;
                case HostBus::FrameKind::Close:
                    reason = "peer sent close";
                    closing_.store(true);
                    break;
                case HostBus::FrameKind::Data:
                    if (on_data_) on_data_(shared_from_this(), std::move(body));
                    break;
            }
        }
    } catch (const std::system_error& e) {
        if (closing_.load()) {
            reason = "closed locally";
        } else if (e.code() == std::errc::not_connected || e.code() == std::errc::connection_reset) {
            reason = "peer closed the connection";
        } else {
            reason = std::string("I/O error: ") + e.what();
        }
    } catch (const std::exception& e) {
        reason = std::string("session error: ") + e.what();
    }

    closing_.store(true);
    adapter_->close();
    logger_->debug("Client " + id_ + ": reader finished (" + reason + ")");
    if (on_close_) {
        on_close_(shared_from_this(), reason);
    }
    co_return;
}

} // namespace bus
