/**
 * @file bridge/builtins/KnowledgeBridge.cpp
 * @brief `knowledgeService` entries of the bridge catalog.
 */
#include "BuiltinBridges.hpp"
#include "bridge/registry/BridgeInvoker.hpp"

#include <stdexcept>

namespace HostBus::Bridge {

namespace {
constexpr const char* kService = "knowledgeService";
}

void register_knowledge_bridge(BridgeRegistry& registry, std::shared_ptr<IKnowledgeService> service) {
    if (!service) {
        throw std::invalid_argument("register_knowledge_bridge: null service");
    }

    registry.register_method({
        kService, "createKnowledge",
        "Create a new knowledge base",
        {
            BridgeParam::required_param("name", ParamType::String, "Knowledge base name"),
            BridgeParam::optional_param("description", ParamType::String, "Knowledge base description"),
            BridgeParam::optional_param("embeddingModel", ParamType::String,
                                        "Embedding provider: 'ollama' or 'openai'", "ollama"),
            BridgeParam::optional_param("embeddingModelName", ParamType::String,
                                        "Embedding model name", "nomic-embed-text"),
        },
        "The created knowledge base (id, name, documentCount, ...)",
        R"({"name": "Frontend docs", "description": "Notes about the UI code"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string, std::optional<std::string>, std::string, std::string>(
            [service](const std::string& name, const std::optional<std::string>& description,
                      const std::string& model, const std::string& model_name) {
                return service->create_knowledge(name, description, model, model_name);
            }),
    });

    registry.register_method({
        kService, "deleteKnowledge",
        "Delete a knowledge base and all of its documents",
        {BridgeParam::required_param("knowledgeId", ParamType::String, "Knowledge base id")},
        "boolean, true when the knowledge base existed",
        R"({"knowledgeId": "kb_1"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string>([service](const std::string& id) {
            return service->delete_knowledge(id);
        }),
    });

    registry.register_method({
        kService, "listKnowledge",
        "List all knowledge bases",
        {},
        "Array of knowledge bases",
        {},
        ArgumentStyle::Positional,
        make_bridge_handler<>([service]() { return service->list_knowledge(); }),
    });

    registry.register_method({
        kService, "getKnowledge",
        "Get one knowledge base by id",
        {BridgeParam::required_param("knowledgeId", ParamType::String, "Knowledge base id")},
        "The knowledge base, or null when it does not exist",
        R"({"knowledgeId": "kb_1"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string>([service](const std::string& id) {
            return service->get_knowledge(id);
        }),
    });

    registry.register_method({
        kService, "updateKnowledge",
        "Update name, description or embedding settings of a knowledge base",
        {
            BridgeParam::required_param("knowledgeId", ParamType::String, "Knowledge base id"),
            BridgeParam::required_param("data", ParamType::Object,
                                        "Fields to change: name, description, embeddingModel, embeddingModelName"),
        },
        "The updated knowledge base, or null when it does not exist",
        R"({"knowledgeId": "kb_1", "data": {"name": "Renamed"}})",
        ArgumentStyle::Structured,
        make_bridge_handler<std::string, nlohmann::json>(
            [service](const std::string& id, const nlohmann::json& data) {
                return service->update_knowledge(id, data);
            }),
    });

    registry.register_method({
        kService, "listDocuments",
        "List the documents stored in a knowledge base",
        {BridgeParam::required_param("knowledgeId", ParamType::String, "Knowledge base id")},
        "Array of documents",
        R"({"knowledgeId": "kb_1"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string>([service](const std::string& id) {
            return service->list_documents(id);
        }),
    });
}

void register_builtin_bridges(BridgeRegistry& registry, const BridgeServices& services) {
    if (services.knowledge) register_knowledge_bridge(registry, services.knowledge);
    if (services.conversation) register_conversation_bridge(registry, services.conversation);
    if (services.memory) register_memory_bridge(registry, services.memory);
    if (services.user) register_user_bridge(registry, services.user);
}

} // namespace HostBus::Bridge
