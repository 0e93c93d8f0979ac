/**
 * \file bus/session/ClientSession.hpp
 * \brief One connected bus peer: frame reader coroutine plus serialized writer.
 * \ingroup bus_module
 */
#pragma once

#include "bus/BusConfig.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"
#include "message/Frame.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/socket/IBlockingStream.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace bus {

/**
 * \brief Connection state of one peer.
 * \ingroup bus_module
 *
 * Reading happens on a single coroutine, so frames of one connection are handled in
 * arrival order. Writes go through the socket's blocking role under a per-session
 * mutex and may come from any thread. The adapter's own awaitables are reserved for the
 * reader, since an adapter allows one in-flight operation.
 */
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using Clock = std::chrono::steady_clock;
    using FrameCallback = std::function<void(const std::shared_ptr<ClientSession>&, std::string&& body)>;
    using CloseCallback = std::function<void(const std::shared_ptr<ClientSession>&, const std::string& reason)>;

    /**
     * \param adapter Connected socket on the bus I/O context.
     * \param id Opaque client id.
     * \throws std::invalid_argument when the adapter is null or lacks a blocking role.
     */
    ClientSession(std::shared_ptr<transport::CoroSocketAdapter> adapter,
                  std::string id,
                  const BusConfig& config,
                  std::shared_ptr<Logger> logger);

    ClientSession(const ClientSession&) = delete;
    ClientSession& operator=(const ClientSession&) = delete;

    /**
     * \brief Launch the reader coroutine.
     * \param on_data Called with the body of every Data frame.
     * \param on_close Called once when the reader finishes for any reason.
     */
    void run(FrameCallback on_data, CloseCallback on_close);

    /** \brief Write one pre-encoded frame. False if closing or the write failed. */
    bool send_frame(const std::string& frame);
    bool send(const HostBus::Envelope& envelope);
    bool send_ping();

    /** \brief Orderly close; the reader resumes with an error and finishes. */
    void close();
    /** \brief Close with a connection reset (zero linger). */
    void abort();

    bool is_open() const;
    /** \brief True once the reader coroutine has finished. */
    bool is_done() const;

    const std::string& id() const { return id_; }
    ClientRole role() const { return role_.load(); }
    void set_role(ClientRole role) { role_.store(role); }
    std::string endpoint() const;

    /** \brief Epoch milliseconds of the connect. */
    int64_t connected_at() const { return connected_at_; }
    /** \brief Last inbound frame or pong; never moves backwards. */
    Clock::time_point last_activity() const;
    /** \brief Record activity now. */
    void touch();
    /** \brief Record activity at `when`, ignoring values older than the current one. */
    void touch(Clock::time_point when);

    uint64_t frames_received() const { return frames_received_.load(); }
    uint64_t frames_sent() const { return frames_sent_.load(); }

private:
    Task<void> read_loop();

    std::shared_ptr<transport::CoroSocketAdapter> adapter_;
    std::shared_ptr<IBlockingStream> writer_;
    std::string id_;
    uint32_t max_frame_body_;
    std::chrono::milliseconds write_timeout_;
    std::shared_ptr<Logger> logger_;

    std::atomic<ClientRole> role_{ClientRole::Renderer};
    int64_t connected_at_;
    std::atomic<Clock::rep> last_activity_;
    std::atomic<bool> closing_{false};
    std::atomic<uint64_t> frames_received_{0};
    std::atomic<uint64_t> frames_sent_{0};

    std::mutex write_mutex_;
    FrameCallback on_data_;
    CloseCallback on_close_;
    std::unique_ptr<Task<void>> reader_;
    std::atomic<bool> reader_started_{false};  ///< Set once reader_ is assigned
};

} // namespace bus
