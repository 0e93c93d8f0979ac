#include "BusClient.hpp"
#include "transport/socket/SocketFactory.hpp"

#include <stdexcept>

namespace bus {

using HostBus::Envelope;
using HostBus::FrameHeader;
using HostBus::FrameKind;
using HostBus::MessageType;

namespace {
/// Once a frame has started, the rest of it must arrive within this budget.
constexpr auto kFrameCompletion = std::chrono::milliseconds(5000);
constexpr auto kWriteTimeout = std::chrono::milliseconds(5000);
}

BusClient::BusClient(std::shared_ptr<Logger> logger, uint32_t max_frame_body)
    : logger_(std::move(logger)), max_frame_body_(max_frame_body) {
    if (!logger_) {
        throw std::invalid_argument("BusClient requires a logger");
    }
}

BusClient::~BusClient() {
    if (socket_) socket_->close();
}

bool BusClient::connect(const std::string& host, int port, std::error_code& error,
                        std::chrono::milliseconds timeout) {
    error.clear();
    if (connected_) return true;

    socket_ = transport::SocketFactory::create_blocking_client(logger_);
    socket_->connect(host, port, error, timeout);
    if (error) {
        logger_->warning("BusClient: connect to " + host + ":" + std::to_string(port) + " failed: " + error.message());
        socket_.reset();
        return false;
    }
    connected_ = true;

    auto ack = receive(timeout);
    if (!ack || ack->type() != MessageType::CONNECTION_ACK) {
        error = std::make_error_code(std::errc::protocol_error);
        logger_->warning("BusClient: no CONNECTION_ACK from " + host + ":" + std::to_string(port));
        drop_connection("missing acknowledgement");
        return false;
    }
    client_id_ = ack->string_field("clientId");
    logger_->debug("BusClient: connected as " + client_id_);
    return true;
}

bool BusClient::identify(ClientRole role) {
    return send(Envelope::create(MessageType::CLIENT_IDENTIFY, {{"clientType", to_string(role)}}));
}

bool BusClient::send(const Envelope& envelope) {
    return write_bytes(HostBus::encode_frame(FrameKind::Data, envelope.serialize()));
}

bool BusClient::send_raw(const std::string& bytes) {
    return write_bytes(bytes);
}

bool BusClient::send_ping() {
    return write_bytes(HostBus::encode_frame(FrameKind::Ping));
}

bool BusClient::write_bytes(const std::string& bytes) {
    if (!connected_ || !socket_) return false;
    std::lock_guard<std::mutex> lk(write_mutex_);
    std::error_code ec;
    std::size_t written = 0;
    socket_->write(bytes.data(), bytes.size(), written, ec, kWriteTimeout);
    if (ec || written != bytes.size()) {
        logger_->debug("BusClient: write failed: " + (ec ? ec.message() : std::string("short write")));
        return false;
    }
    return true;
}

BusClient::ReadStatus BusClient::read_exact(void* buffer, std::size_t size,
                                            std::chrono::steady_clock::time_point deadline,
                                            bool allow_idle_timeout) {
    auto* out = static_cast<char*>(buffer);
    std::size_t done = 0;
    while (done < size) {
        const auto now = std::chrono::steady_clock::now();
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        if (remaining.count() <= 0) remaining = std::chrono::milliseconds(1);

        std::error_code ec;
        std::size_t n = 0;
        socket_->read(out + done, size - done, n, ec, remaining);
        if (ec == std::errc::timed_out) {
            if (done == 0 && allow_idle_timeout) return ReadStatus::Timeout;
            drop_connection("frame timed out");
            return ReadStatus::Failed;
        }
        if (ec) {
            drop_connection(ec.message());
            return ReadStatus::Failed;
        }
        done += n;
    }
    return ReadStatus::Ok;
}

std::optional<Envelope> BusClient::receive(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (connected_) {
        if (std::chrono::steady_clock::now() >= deadline) return std::nullopt;

        FrameHeader header{};
        const auto st = read_exact(&header, sizeof(header), deadline, true);
        if (st != ReadStatus::Ok) return std::nullopt;

        std::string reason;
        if (!HostBus::validate_frame_header(header, max_frame_body_, reason)) {
            drop_connection(reason);
            return std::nullopt;
        }
        std::string body(header.body_size, '\0');
        if (!body.empty()) {
            const auto body_deadline = std::chrono::steady_clock::now() + kFrameCompletion;
            if (read_exact(body.data(), body.size(), body_deadline, false) != ReadStatus::Ok) return std::nullopt;
        }

        switch (static_cast<FrameKind>(header.kind)) {
            case FrameKind::Ping:
                pings_received_.fetch_add(1);
                if (auto_pong_) write_bytes(HostBus::encode_frame(FrameKind::Pong));
                continue;
            case FrameKind::Pong:
                continue;
            case FrameKind::Close:
                drop_connection("closed by server");
                return std::nullopt;
            case FrameKind::Data:
                break;
        }

        std::string error;
        auto envelope = Envelope::parse(body, error);
        if (!envelope) {
            logger_->warning("BusClient: skipped malformed message: " + error);
            continue;
        }
        return envelope;
    }
    return std::nullopt;
}

std::optional<Envelope> BusClient::receive_type(MessageType type, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (connected_) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) break;
        auto envelope = receive(remaining);
        if (envelope && envelope->type() == type) return envelope;
    }
    return std::nullopt;
}

void BusClient::close() {
    if (!socket_) return;
    if (connected_) {
        write_bytes(HostBus::encode_frame(FrameKind::Close));
    }
    drop_connection("closed locally");
}

void BusClient::drop_connection(const std::string& reason) {
    if (connected_.exchange(false)) {
        logger_->debug("BusClient: disconnected (" + reason + ")");
    }
    if (socket_) socket_->close();
}

} // namespace bus
