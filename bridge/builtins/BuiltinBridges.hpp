/**
 * @file bridge/builtins/BuiltinBridges.hpp
 * @brief Registration of the built-in bridge catalog.
 */
#pragma once

#include "bridge/registry/BridgeRegistry.hpp"
#include "bridge/services/DomainServices.hpp"

#include <memory>

namespace HostBus::Bridge {

/// Services the built-in catalog dispatches to. Null members skip that service.
struct BridgeServices {
    std::shared_ptr<IKnowledgeService> knowledge;
    std::shared_ptr<IConversationService> conversation;
    std::shared_ptr<IMemoryService> memory;
    std::shared_ptr<IUserService> user;
};

void register_knowledge_bridge(BridgeRegistry& registry, std::shared_ptr<IKnowledgeService> service);
void register_conversation_bridge(BridgeRegistry& registry, std::shared_ptr<IConversationService> service);
void register_memory_bridge(BridgeRegistry& registry, std::shared_ptr<IMemoryService> service);
void register_user_bridge(BridgeRegistry& registry, std::shared_ptr<IUserService> service);

/// Register every non-null service of `services`. Does not seal the registry.
void register_builtin_bridges(BridgeRegistry& registry, const BridgeServices& services);

} // namespace HostBus::Bridge
