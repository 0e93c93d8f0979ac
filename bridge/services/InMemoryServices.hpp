/**
 * @file bridge/services/InMemoryServices.hpp
 * @brief Process-local implementations of the bridged domain services.
 *
 * The host uses these when no database-backed implementation is plugged in. All
 * state lives in memory and is lost on exit. Each class is internally synchronized.
 */
#pragma once

#include "DomainServices.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <string>

namespace HostBus::Bridge {

class InMemoryKnowledgeService : public IKnowledgeService {
public:
    nlohmann::json create_knowledge(const std::string& name,
                                    const std::optional<std::string>& description,
                                    const std::string& embedding_model,
                                    const std::string& embedding_model_name) override;
    bool delete_knowledge(const std::string& knowledge_id) override;
    nlohmann::json list_knowledge() override;
    nlohmann::json get_knowledge(const std::string& knowledge_id) override;
    nlohmann::json update_knowledge(const std::string& knowledge_id, const nlohmann::json& data) override;
    nlohmann::json list_documents(const std::string& knowledge_id) override;
    void import_knowledge(const nlohmann::json& knowledge) override;

    /// Attach a document record to a knowledge base (used by sync and tests).
    void add_document(const std::string& knowledge_id, nlohmann::json document);

private:
    mutable std::mutex mutex_;
    uint64_t next_id_{1};
    std::map<std::string, nlohmann::json> bases_;
    std::map<std::string, nlohmann::json> documents_;  ///< knowledge id -> array
};

class InMemoryConversationService : public IConversationService {
public:
    nlohmann::json create_conversation(const std::optional<std::string>& title,
                                       const std::optional<int64_t>& model_id,
                                       const std::optional<std::string>& model_name) override;
    bool delete_conversation(int64_t id) override;
    nlohmann::json get_conversation_list() override;
    nlohmann::json get_conversation_by_id(int64_t id) override;
    bool update_conversation_title(int64_t id, const std::string& title) override;

private:
    std::mutex mutex_;
    int64_t next_id_{1};
    std::map<int64_t, nlohmann::json> conversations_;
};

class InMemoryMemoryService : public IMemoryService {
public:
    nlohmann::json save_memory(const std::string& memory_type,
                               const std::string& memory_key,
                               const std::string& memory_value,
                               const std::optional<int64_t>& source_conversation_id,
                               double confidence) override;
    nlohmann::json get_all_memories() override;
    nlohmann::json get_memories_by_type(const std::string& memory_type) override;
    bool delete_memory(int64_t memory_id) override;
    nlohmann::json build_memory_context() override;

private:
    std::mutex mutex_;
    int64_t next_id_{1};
    std::map<int64_t, nlohmann::json> memories_;
};

class InMemoryUserService : public IUserService {
public:
    InMemoryUserService();

    nlohmann::json get_current_user(int64_t user_id) override;
    nlohmann::json update_profile(int64_t user_id, const nlohmann::json& data) override;

private:
    std::mutex mutex_;
    std::map<int64_t, nlohmann::json> users_;
};

} // namespace HostBus::Bridge
