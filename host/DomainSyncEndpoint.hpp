/**
 * \file host/DomainSyncEndpoint.hpp
 * \brief Applies knowledge changes announced by the worker and relays them to the UI.
 */
#pragma once

#include "bridge/services/DomainServices.hpp"
#include "bus/MessageBus.hpp"
#include "logger.hpp"
#include "message/Envelope.hpp"

#include <memory>

namespace host {

class DomainSyncEndpoint {
public:
    DomainSyncEndpoint(bus::MessageBus& bus, std::shared_ptr<HostBus::Bridge::IKnowledgeService> knowledge,
                       std::shared_ptr<Logger> logger);

    void attach();

    /**
     * \brief Apply `KNOWLEDGE_SYNC_CREATE{knowledge}` or `KNOWLEDGE_SYNC_DELETE{knowledgeId}`.
     * \return False (and logs) when the payload is unusable or the service rejects it.
     */
    bool apply(const HostBus::Envelope& envelope);

private:
    bus::MessageBus& bus_;
    std::shared_ptr<HostBus::Bridge::IKnowledgeService> knowledge_;
    std::shared_ptr<Logger> logger_;
};

} // namespace host
