/**
 * \file bus/MessageRouter.hpp
 * \brief Role-aware dispatch of inbound envelopes.
 * \ingroup bus_module
 */
#pragma once

#include "bus/session/ClientRegistry.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace bus {

/**
 * \brief Decides where an inbound envelope goes.
 * \ingroup bus_module
 *
 * Built-in rules:
 * - `PING` is answered with `PONG`.
 * - `CLIENT_IDENTIFY` sets the sender's role; a worker identifying is announced to
 *   renderers with `PYTHON_STATUS{status:"running"}`.
 * - `CHAT_MESSAGE` and `AGENT_CHAT` are forwarded to the worker, or answered with a
 *   failed `CHAT_RESPONSE` when no worker is connected.
 * - Chat and agent output coming from the worker is fanned out to renderers.
 *
 * Everything else goes to the handler registered with `on()`, or is dropped.
 */
class MessageRouter {
public:
    using Handler = std::function<void(const std::string& client_id, const HostBus::Envelope&)>;

    MessageRouter(ClientRegistry& registry, std::shared_ptr<Logger> logger);

    /** \brief Install (or replace) the handler for `type`; an empty handler removes it. */
    void on(HostBus::MessageType type, Handler handler);

    void route(const std::shared_ptr<ClientSession>& from, const HostBus::Envelope& envelope);

    /** \brief Bookkeeping after a session closed or was evicted. */
    void client_closed(const ClientSession& session);

    std::size_t broadcast_to_renderers(const HostBus::Envelope& envelope);
    /** \brief Send to the identified worker(s); number of deliveries. */
    std::size_t send_to_worker(const HostBus::Envelope& envelope);

private:
    static bool is_worker_output(HostBus::MessageType type);

    ClientRegistry& registry_;
    std::shared_ptr<Logger> logger_;
    std::mutex handlers_mutex_;
    std::map<HostBus::MessageType, Handler> handlers_;
};

} // namespace bus
