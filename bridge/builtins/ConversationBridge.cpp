/**
 * @file bridge/builtins/ConversationBridge.cpp
 * @brief `conversationService` entries of the bridge catalog.
 */
#include "BuiltinBridges.hpp"
#include "bridge/registry/BridgeInvoker.hpp"

#include <stdexcept>

namespace HostBus::Bridge {

namespace {
constexpr const char* kService = "conversationService";
}

void register_conversation_bridge(BridgeRegistry& registry, std::shared_ptr<IConversationService> service) {
    if (!service) {
        throw std::invalid_argument("register_conversation_bridge: null service");
    }

    registry.register_method({
        kService, "createConversation",
        "Create a new conversation",
        {
            BridgeParam::optional_param("title", ParamType::String, "Conversation title"),
            BridgeParam::optional_param("modelId", ParamType::Number, "Id of the model used"),
            BridgeParam::optional_param("modelName", ParamType::String, "Name of the model used"),
        },
        "The created conversation",
        R"({"title": "Weekly planning"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::optional<std::string>, std::optional<int64_t>, std::optional<std::string>>(
            [service](const std::optional<std::string>& title, const std::optional<int64_t>& model_id,
                      const std::optional<std::string>& model_name) {
                return service->create_conversation(title, model_id, model_name);
            }),
    });

    registry.register_method({
        kService, "deleteConversation",
        "Delete a conversation",
        {BridgeParam::required_param("id", ParamType::Number, "Conversation id")},
        "boolean, true when the conversation existed",
        R"({"id": 1})",
        ArgumentStyle::Positional,
        make_bridge_handler<int64_t>([service](int64_t id) { return service->delete_conversation(id); }),
    });

    registry.register_method({
        kService, "getConversationList",
        "List all conversations, newest first",
        {},
        "Array of conversations",
        {},
        ArgumentStyle::Positional,
        make_bridge_handler<>([service]() { return service->get_conversation_list(); }),
    });

    registry.register_method({
        kService, "getConversationById",
        "Get one conversation by id",
        {BridgeParam::required_param("id", ParamType::Number, "Conversation id")},
        "The conversation, or null when it does not exist",
        R"({"id": 1})",
        ArgumentStyle::Positional,
        make_bridge_handler<int64_t>([service](int64_t id) { return service->get_conversation_by_id(id); }),
    });

    registry.register_method({
        kService, "updateConversationTitle",
        "Rename a conversation",
        {
            BridgeParam::required_param("id", ParamType::Number, "Conversation id"),
            BridgeParam::required_param("title", ParamType::String, "New title"),
        },
        "boolean, true when the conversation existed",
        R"({"id": 1, "title": "Renamed"})",
        ArgumentStyle::Positional,
        make_bridge_handler<int64_t, std::string>([service](int64_t id, const std::string& title) {
            return service->update_conversation_title(id, title);
        }),
    });
}

} // namespace HostBus::Bridge
