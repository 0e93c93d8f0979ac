/**
 * \file bus/BusClient.hpp
 * \brief Blocking peer of the message bus.
 * \ingroup bus_module
 * \details Used by worker-side peers and by the test-suite. One thread receives;
 * sends may come from any thread.
 */
#pragma once

#include "BusConfig.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"
#include "message/Frame.hpp"
#include "transport/socket/IBlockingStream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>

namespace bus {

class BusClient {
public:
    explicit BusClient(std::shared_ptr<Logger> logger, uint32_t max_frame_body = HostBus::kDefaultMaxFrameBody);
    ~BusClient();

    BusClient(const BusClient&) = delete;
    BusClient& operator=(const BusClient&) = delete;

    /**
     * \brief Connect and wait for the server's `CONNECTION_ACK`.
     * \param error Receives the socket error, or `protocol_error` when the first
     *        message is not an acknowledgement.
     * \return True once the client id is known.
     */
    bool connect(const std::string& host, int port, std::error_code& error,
                 std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

    /** \brief Announce the role through `CLIENT_IDENTIFY`. */
    bool identify(ClientRole role);

    bool send(const HostBus::Envelope& envelope);
    /** \brief Write already encoded bytes, e.g. a hand-built frame. */
    bool send_raw(const std::string& bytes);
    bool send_ping();

    /**
     * \brief Next envelope from the server.
     * \details Ping frames are answered with Pong while waiting (unless disabled);
     * Pong frames and malformed bodies are skipped. A Close frame or a socket error
     * disconnects the client.
     * \return nullopt on timeout or disconnect.
     */
    std::optional<HostBus::Envelope> receive(std::chrono::milliseconds timeout);

    /** \brief Receive until an envelope of `type` arrives, discarding others. */
    std::optional<HostBus::Envelope> receive_type(HostBus::MessageType type, std::chrono::milliseconds timeout);

    /** \brief Send a Close frame, then close the socket. */
    void close();

    bool is_connected() const { return connected_.load(); }
    const std::string& client_id() const { return client_id_; }

    void set_auto_pong(bool enabled) { auto_pong_.store(enabled); }
    uint64_t pings_received() const { return pings_received_.load(); }

private:
    enum class ReadStatus { Ok, Timeout, Failed };
    ReadStatus read_exact(void* buffer, std::size_t size, std::chrono::steady_clock::time_point deadline,
                          bool allow_idle_timeout);
    bool write_bytes(const std::string& bytes);
    void drop_connection(const std::string& reason);

    std::shared_ptr<Logger> logger_;
    uint32_t max_frame_body_;
    std::shared_ptr<IBlockingStream> socket_;
    std::string client_id_;
    std::mutex write_mutex_;
    std::atomic<bool> connected_{false};
    std::atomic<bool> auto_pong_{true};
    std::atomic<uint64_t> pings_received_{0};
};

} // namespace bus
