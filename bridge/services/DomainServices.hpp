/**
 * @file bridge/services/DomainServices.hpp
 * @brief Abstract host-side domain services reachable through the bridge.
 *
 * Implementations report failure by throwing; the bridge registry converts the
 * exception into a failed call result. Return values are JSON so they travel over
 * the bus without further conversion.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace HostBus::Bridge {

/**
 * @brief Knowledge bases and their documents.
 *
 * A knowledge record is `{id, name, description, embeddingModel,
 * embeddingModelName, documentCount, createdAt, updatedAt}`.
 */
class IKnowledgeService {
public:
    virtual ~IKnowledgeService() = default;

    virtual nlohmann::json create_knowledge(const std::string& name,
                                            const std::optional<std::string>& description,
                                            const std::string& embedding_model,
                                            const std::string& embedding_model_name) = 0;
    virtual bool delete_knowledge(const std::string& knowledge_id) = 0;
    virtual nlohmann::json list_knowledge() = 0;
    /// Knowledge record or null.
    virtual nlohmann::json get_knowledge(const std::string& knowledge_id) = 0;
    /// Updated record or null when the id is unknown.
    virtual nlohmann::json update_knowledge(const std::string& knowledge_id, const nlohmann::json& data) = 0;
    virtual nlohmann::json list_documents(const std::string& knowledge_id) = 0;

    /// Insert or replace a record created elsewhere (worker-side sync).
    virtual void import_knowledge(const nlohmann::json& knowledge) = 0;
};

class IConversationService {
public:
    virtual ~IConversationService() = default;

    virtual nlohmann::json create_conversation(const std::optional<std::string>& title,
                                               const std::optional<int64_t>& model_id,
                                               const std::optional<std::string>& model_name) = 0;
    virtual bool delete_conversation(int64_t id) = 0;
    virtual nlohmann::json get_conversation_list() = 0;
    virtual nlohmann::json get_conversation_by_id(int64_t id) = 0;
    virtual bool update_conversation_title(int64_t id, const std::string& title) = 0;
};

/**
 * @brief Long-term user memories.
 *
 * `memoryType` is one of preference, project, task, fact, context.
 */
class IMemoryService {
public:
    virtual ~IMemoryService() = default;

    virtual nlohmann::json save_memory(const std::string& memory_type,
                                       const std::string& memory_key,
                                       const std::string& memory_value,
                                       const std::optional<int64_t>& source_conversation_id,
                                       double confidence) = 0;
    virtual nlohmann::json get_all_memories() = 0;
    virtual nlohmann::json get_memories_by_type(const std::string& memory_type) = 0;
    virtual bool delete_memory(int64_t memory_id) = 0;
    /// `{memories, summaries, contextPrompt}`
    virtual nlohmann::json build_memory_context() = 0;
};

class IUserService {
public:
    virtual ~IUserService() = default;

    virtual nlohmann::json get_current_user(int64_t user_id) = 0;
    virtual nlohmann::json update_profile(int64_t user_id, const nlohmann::json& data) = 0;
};

} // namespace HostBus::Bridge
