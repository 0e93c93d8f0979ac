/**
 * \file host/BridgeEndpoint.hpp
 * \brief Serves the bridge registry over the message bus.
 */
#pragma once

#include "bridge/registry/BridgeRegistry.hpp"
#include "bus/MessageBus.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"

#include <memory>

namespace host {

/**
 * \brief Answers `FRONTEND_BRIDGE_REQUEST` and `FRONTEND_BRIDGE_LIST` to their sender.
 * \details The registry must be sealed before `attach()`.
 */
class BridgeEndpoint {
public:
    BridgeEndpoint(bus::MessageBus& bus, const HostBus::Bridge::BridgeRegistry& registry,
                   std::shared_ptr<Logger> logger);

    /** \brief Install the bus handlers. \throws std::logic_error if the registry is not sealed. */
    void attach();

    /** \brief `FRONTEND_BRIDGE_RESPONSE{success, requestId, result|error}` for one request. */
    HostBus::Envelope handle_request(const HostBus::Envelope& request) const;
    /** \brief `FRONTEND_BRIDGE_LIST_RESPONSE{success, methods, count, requestId}`. */
    HostBus::Envelope handle_list(const HostBus::Envelope& request) const;

private:
    bus::MessageBus& bus_;
    const HostBus::Bridge::BridgeRegistry& registry_;
    std::shared_ptr<Logger> logger_;
};

} // namespace host
