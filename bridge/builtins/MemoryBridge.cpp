/**
 * @file bridge/builtins/MemoryBridge.cpp
 * @brief `memoryService` entries of the bridge catalog.
 */
#include "BuiltinBridges.hpp"
#include "bridge/registry/BridgeInvoker.hpp"

#include <stdexcept>

namespace HostBus::Bridge {

namespace {
constexpr const char* kService = "memoryService";
}

void register_memory_bridge(BridgeRegistry& registry, std::shared_ptr<IMemoryService> service) {
    if (!service) {
        throw std::invalid_argument("register_memory_bridge: null service");
    }

    registry.register_method({
        kService, "saveMemory",
        "Remember a fact about the user; an existing memory with the same type and key is overwritten",
        {
            BridgeParam::required_param("memoryType", ParamType::String,
                                        "One of preference, project, task, fact, context"),
            BridgeParam::required_param("memoryKey", ParamType::String, "Short identifying key"),
            BridgeParam::required_param("memoryValue", ParamType::String, "Content to remember"),
            BridgeParam::optional_param("sourceConversationId", ParamType::Number,
                                        "Conversation the memory came from"),
            BridgeParam::optional_param("confidence", ParamType::Number, "Confidence between 0 and 1", 1.0),
        },
        "The saved memory",
        R"({"memoryType": "preference", "memoryKey": "language", "memoryValue": "Prefers C++"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string, std::string, std::string, std::optional<int64_t>, double>(
            [service](const std::string& type, const std::string& key, const std::string& value,
                      const std::optional<int64_t>& source, double confidence) {
                return service->save_memory(type, key, value, source, confidence);
            }),
    });

    registry.register_method({
        kService, "getAllMemories",
        "List every stored memory",
        {},
        "Array of memories",
        {},
        ArgumentStyle::Positional,
        make_bridge_handler<>([service]() { return service->get_all_memories(); }),
    });

    registry.register_method({
        kService, "getMemoriesByType",
        "List memories of one type",
        {BridgeParam::required_param("memoryType", ParamType::String,
                                     "One of preference, project, task, fact, context")},
        "Array of memories",
        R"({"memoryType": "project"})",
        ArgumentStyle::Positional,
        make_bridge_handler<std::string>([service](const std::string& type) {
            return service->get_memories_by_type(type);
        }),
    });

    registry.register_method({
        kService, "deleteMemory",
        "Forget one memory",
        {BridgeParam::required_param("memoryId", ParamType::Number, "Memory id")},
        "boolean, true when the memory existed",
        R"({"memoryId": 1})",
        ArgumentStyle::Positional,
        make_bridge_handler<int64_t>([service](int64_t id) { return service->delete_memory(id); }),
    });

    registry.register_method({
        kService, "buildMemoryContext",
        "Build the memory context block injected into prompts",
        {},
        "Object with memories, summaries and contextPrompt",
        {},
        ArgumentStyle::Positional,
        make_bridge_handler<>([service]() { return service->build_memory_context(); }),
    });
}

} // namespace HostBus::Bridge
