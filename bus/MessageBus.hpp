/**
 * \defgroup bus_module Socket Message Bus
 * \brief Multi-client local bus carrying typed envelopes between the host, its UI
 *        clients and the supervised worker.
 *
 * MessageBus owns the coroutine I/O context, the listening socket, a dedicated
 * acceptor thread and the heartbeat timer. Each accepted connection becomes a
 * `ClientSession` whose reader coroutine feeds the `MessageRouter`.
 * @{
 */
#pragma once

#include "BusConfig.hpp"
#include "MessageRouter.hpp"
#include "bus/session/ClientRegistry.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"
#include "periodicTimer.hpp"
#include "transport/coro/CoroSocketAdapter.hpp"
#include "transport/coro/coroIoContext.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace bus {

/**
 * \brief Socket server with unicast, broadcast and heartbeat eviction.
 */
class MessageBus {
public:
    using Handler = MessageRouter::Handler;

    explicit MessageBus(std::shared_ptr<Logger> logger);
    ~MessageBus();

    MessageBus(const MessageBus&) = delete;
    MessageBus& operator=(const MessageBus&) = delete;

    /**
     * \brief Bind, listen and start serving.
     * \details Idempotent: while running, returns the current endpoint unchanged.
     * \throws std::system_error carrying the OS error when bind or listen fails.
     * \throws std::invalid_argument for a non-positive heartbeat interval.
     */
    BusEndpoint start_server(const BusConfig& config);

    /**
     * \brief Cancel the heartbeat, close every connection, close the listener and
     *        stop the I/O loop, in that order. Idempotent; returns when all is done.
     */
    void stop_server();

    bool is_running() const { return running_.load(); }

    /** \brief Serialize once and write to every open connection. Returns deliveries. */
    std::size_t broadcast(const HostBus::Envelope& envelope);
    /** \brief Deliver to one client; false when no open connection has that id. Never throws. */
    bool send_to_client(const std::string& client_id, const HostBus::Envelope& envelope) noexcept;
    /** \brief Deliver to renderer connections only. */
    std::size_t broadcast_to_renderers(const HostBus::Envelope& envelope);

    /** \brief Register the handler for an envelope type not routed by built-in rules. */
    void on(HostBus::MessageType type, Handler handler);

    ServerInfo get_server_info() const;
    std::size_t client_count() const;
    std::vector<std::string> client_ids() const;
    bool is_worker_connected() const;

    /**
     * \brief One heartbeat pass: evict connections idle for more than twice the
     *        interval, ping the rest. Runs on the heartbeat timer.
     * \return Number of evicted connections.
     */
    std::size_t run_heartbeat();

private:
    void acceptor_loop();
    void accept_client(std::shared_ptr<transport::CoroSocketAdapter> adapter);
    void handle_data(const std::shared_ptr<ClientSession>& session, std::string&& body);
    void handle_close(const std::shared_ptr<ClientSession>& session, const std::string& reason);
    std::string next_client_id();
    void wait_for_sessions(const std::vector<std::shared_ptr<ClientSession>>& sessions,
                           std::chrono::milliseconds budget);

    std::shared_ptr<Logger> logger_;
    ClientRegistry registry_;
    MessageRouter router_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    BusConfig config_;
    BusEndpoint endpoint_;
    std::shared_ptr<transport::CoroIoContext> io_;
    std::optional<transport::CoroIoContext::WorkGuard> io_guard_;
    std::shared_ptr<transport::CoroSocketAdapter> listener_;
    std::thread acceptor_thread_;
    std::unique_ptr<PeriodicTimer> heartbeat_;
    std::atomic<uint64_t> client_seq_{0};
};

} // namespace bus

/// @}
