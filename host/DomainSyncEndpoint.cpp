#include "DomainSyncEndpoint.hpp"

#include <stdexcept>

namespace host {

using HostBus::Envelope;
using HostBus::MessageType;

DomainSyncEndpoint::DomainSyncEndpoint(bus::MessageBus& bus,
                                       std::shared_ptr<HostBus::Bridge::IKnowledgeService> knowledge,
                                       std::shared_ptr<Logger> logger)
    : bus_(bus), knowledge_(std::move(knowledge)), logger_(std::move(logger)) {
    if (!knowledge_ || !logger_) {
        throw std::invalid_argument("DomainSyncEndpoint requires a knowledge service and a logger");
    }
}

void DomainSyncEndpoint::attach() {
    auto relay = [this](const std::string& client_id, const Envelope& e) {
        if (!apply(e)) return;
        const auto n = bus_.broadcast_to_renderers(e);
        logger_->debug("Sync: " + HostBus::to_string(e.type()) + " from " + client_id + " relayed to " +
                       std::to_string(n) + " renderer(s)");
    };
    bus_.on(MessageType::KNOWLEDGE_SYNC_CREATE, relay);
    bus_.on(MessageType::KNOWLEDGE_SYNC_DELETE, relay);
}

bool DomainSyncEndpoint::apply(const Envelope& envelope) {
    try {
        if (envelope.type() == MessageType::KNOWLEDGE_SYNC_CREATE) {
            auto it = envelope.fields().find("knowledge");
            if (it == envelope.fields().end() || !it->is_object()) {
                logger_->warning("Sync: knowledge_sync_create without a 'knowledge' object");
                return false;
            }
            knowledge_->import_knowledge(*it);
            logger_->info("Sync: imported knowledge base " + it->value("id", std::string("?")));
            return true;
        }
        if (envelope.type() == MessageType::KNOWLEDGE_SYNC_DELETE) {
            const auto id = envelope.string_field("knowledgeId");
            if (id.empty()) {
                logger_->warning("Sync: knowledge_sync_delete without 'knowledgeId'");
                return false;
            }
            if (!knowledge_->delete_knowledge(id)) {
                logger_->debug("Sync: knowledge base " + id + " was not present");
            }
            return true;
        }
    } catch (const std::exception& e) {
        logger_->error("Sync: " + HostBus::to_string(envelope.type()) + " rejected: " + e.what());
        return false;
    }
    return false;
}

} // namespace host
