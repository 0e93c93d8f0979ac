#include "InMemoryServices.hpp"

#include <array>
#include <chrono>
#include <stdexcept>

namespace HostBus::Bridge {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

constexpr std::array<const char*, 5> kMemoryTypes{"preference", "project", "task", "fact", "context"};

bool is_memory_type(const std::string& type) {
    for (const char* t : kMemoryTypes) {
        if (type == t) return true;
    }
    return false;
}

} // namespace

// ---------------------------------------------------------------------------
// Knowledge
// ---------------------------------------------------------------------------

nlohmann::json InMemoryKnowledgeService::create_knowledge(const std::string& name,
                                                          const std::optional<std::string>& description,
                                                          const std::string& embedding_model,
                                                          const std::string& embedding_model_name) {
    if (name.empty()) {
        throw std::invalid_argument("knowledge base name must not be empty");
    }
    if (embedding_model != "ollama" && embedding_model != "openai") {
        throw std::invalid_argument("embeddingModel must be 'ollama' or 'openai', got '" + embedding_model + "'");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id = "kb_" + std::to_string(next_id_++);
    while (bases_.count(id) != 0) id = "kb_" + std::to_string(next_id_++);
    const int64_t now = now_ms();
    nlohmann::json record{
        {"id", id},
        {"name", name},
        {"description", description ? nlohmann::json(*description) : nlohmann::json(nullptr)},
        {"embeddingModel", embedding_model},
        {"embeddingModelName", embedding_model_name},
        {"documentCount", 0},
        {"createdAt", now},
        {"updatedAt", now},
    };
    bases_[id] = record;
    documents_[id] = nlohmann::json::array();
    return record;
}

bool InMemoryKnowledgeService::delete_knowledge(const std::string& knowledge_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    documents_.erase(knowledge_id);
    return bases_.erase(knowledge_id) != 0;
}

nlohmann::json InMemoryKnowledgeService::list_knowledge() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [id, record] : bases_) out.push_back(record);
    return out;
}

nlohmann::json InMemoryKnowledgeService::get_knowledge(const std::string& knowledge_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bases_.find(knowledge_id);
    return it == bases_.end() ? nlohmann::json(nullptr) : it->second;
}

nlohmann::json InMemoryKnowledgeService::update_knowledge(const std::string& knowledge_id,
                                                          const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("update data must be an object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bases_.find(knowledge_id);
    if (it == bases_.end()) return nullptr;
    for (const char* key : {"name", "description", "embeddingModel", "embeddingModelName"}) {
        if (data.contains(key)) it->second[key] = data.at(key);
    }
    it->second["updatedAt"] = now_ms();
    return it->second;
}

nlohmann::json InMemoryKnowledgeService::list_documents(const std::string& knowledge_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (bases_.count(knowledge_id) == 0) {
        throw std::runtime_error("knowledge base '" + knowledge_id + "' does not exist");
    }
    return documents_[knowledge_id];
}

void InMemoryKnowledgeService::import_knowledge(const nlohmann::json& knowledge) {
    if (!knowledge.is_object() || !knowledge.contains("id") || !knowledge.at("id").is_string()) {
        throw std::invalid_argument("synced knowledge needs a string 'id'");
    }
    const auto id = knowledge.at("id").get<std::string>();
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json record = knowledge;
    if (!record.contains("documentCount")) record["documentCount"] = 0;
    bases_[id] = std::move(record);
    if (documents_.count(id) == 0) documents_[id] = nlohmann::json::array();
}

void InMemoryKnowledgeService::add_document(const std::string& knowledge_id, nlohmann::json document) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = bases_.find(knowledge_id);
    if (it == bases_.end()) {
        throw std::runtime_error("knowledge base '" + knowledge_id + "' does not exist");
    }
    auto& docs = documents_[knowledge_id];
    docs.push_back(std::move(document));
    it->second["documentCount"] = docs.size();
}

// ---------------------------------------------------------------------------
// Conversations
// ---------------------------------------------------------------------------

nlohmann::json InMemoryConversationService::create_conversation(const std::optional<std::string>& title,
                                                                 const std::optional<int64_t>& model_id,
                                                                 const std::optional<std::string>& model_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t id = next_id_++;
    const int64_t now = now_ms();
    nlohmann::json record{
        {"id", id},
        {"title", title.value_or("New conversation")},
        {"modelId", model_id ? nlohmann::json(*model_id) : nlohmann::json(nullptr)},
        {"modelName", model_name ? nlohmann::json(*model_name) : nlohmann::json(nullptr)},
        {"createdAt", now},
        {"updatedAt", now},
    };
    conversations_[id] = record;
    return record;
}

bool InMemoryConversationService::delete_conversation(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return conversations_.erase(id) != 0;
}

nlohmann::json InMemoryConversationService::get_conversation_list() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    // Newest first.
    for (auto it = conversations_.rbegin(); it != conversations_.rend(); ++it) out.push_back(it->second);
    return out;
}

nlohmann::json InMemoryConversationService::get_conversation_by_id(int64_t id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(id);
    return it == conversations_.end() ? nlohmann::json(nullptr) : it->second;
}

bool InMemoryConversationService::update_conversation_title(int64_t id, const std::string& title) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(id);
    if (it == conversations_.end()) return false;
    it->second["title"] = title;
    it->second["updatedAt"] = now_ms();
    return true;
}

// ---------------------------------------------------------------------------
// Memories
// ---------------------------------------------------------------------------

nlohmann::json InMemoryMemoryService::save_memory(const std::string& memory_type,
                                                  const std::string& memory_key,
                                                  const std::string& memory_value,
                                                  const std::optional<int64_t>& source_conversation_id,
                                                  double confidence) {
    if (!is_memory_type(memory_type)) {
        throw std::invalid_argument("unknown memoryType '" + memory_type + "'");
    }
    if (confidence < 0.0 || confidence > 1.0) {
        throw std::invalid_argument("confidence must be within [0, 1]");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    const int64_t now = now_ms();
    // Same type and key overwrites the previous value.
    for (auto& [id, memory] : memories_) {
        if (memory["memoryType"] == memory_type && memory["memoryKey"] == memory_key) {
            memory["memoryValue"] = memory_value;
            memory["confidence"] = confidence;
            if (source_conversation_id) memory["sourceConversationId"] = *source_conversation_id;
            memory["updatedAt"] = now;
            return memory;
        }
    }
    const int64_t id = next_id_++;
    nlohmann::json record{
        {"id", id},
        {"memoryType", memory_type},
        {"memoryKey", memory_key},
        {"memoryValue", memory_value},
        {"sourceConversationId",
         source_conversation_id ? nlohmann::json(*source_conversation_id) : nlohmann::json(nullptr)},
        {"confidence", confidence},
        {"createdAt", now},
        {"updatedAt", now},
    };
    memories_[id] = record;
    return record;
}

nlohmann::json InMemoryMemoryService::get_all_memories() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [id, memory] : memories_) out.push_back(memory);
    return out;
}

nlohmann::json InMemoryMemoryService::get_memories_by_type(const std::string& memory_type) {
    if (!is_memory_type(memory_type)) {
        throw std::invalid_argument("unknown memoryType '" + memory_type + "'");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json out = nlohmann::json::array();
    for (const auto& [id, memory] : memories_) {
        if (memory["memoryType"] == memory_type) out.push_back(memory);
    }
    return out;
}

bool InMemoryMemoryService::delete_memory(int64_t memory_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return memories_.erase(memory_id) != 0;
}

nlohmann::json InMemoryMemoryService::build_memory_context() {
    std::lock_guard<std::mutex> lock(mutex_);
    nlohmann::json memories = nlohmann::json::array();
    std::string prompt;
    for (const char* type : kMemoryTypes) {
        std::string section;
        for (const auto& [id, memory] : memories_) {
            if (memory["memoryType"] != type) continue;
            memories.push_back(memory);
            section += "- " + memory["memoryKey"].get<std::string>() + ": " +
                       memory["memoryValue"].get<std::string>() + "\n";
        }
        if (!section.empty()) {
            prompt += std::string("### ") + type + "\n" + section + "\n";
        }
    }
    if (!prompt.empty()) prompt = "## What I know about the user\n\n" + prompt;
    return nlohmann::json{{"memories", std::move(memories)},
                          {"summaries", nlohmann::json::array()},
                          {"contextPrompt", prompt}};
}

// ---------------------------------------------------------------------------
// Users
// ---------------------------------------------------------------------------

InMemoryUserService::InMemoryUserService() {
    const int64_t now = now_ms();
    users_[1] = nlohmann::json{{"id", 1}, {"username", "default"}, {"displayName", "User"},
                               {"email", nullptr}, {"preferences", nlohmann::json::object()},
                               {"createdAt", now}, {"updatedAt", now}};
}

nlohmann::json InMemoryUserService::get_current_user(int64_t user_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    return it == users_.end() ? nlohmann::json(nullptr) : it->second;
}

nlohmann::json InMemoryUserService::update_profile(int64_t user_id, const nlohmann::json& data) {
    if (!data.is_object()) {
        throw std::invalid_argument("profile data must be an object");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = users_.find(user_id);
    if (it == users_.end()) {
        throw std::runtime_error("user " + std::to_string(user_id) + " does not exist");
    }
    for (const char* key : {"username", "displayName", "email", "avatar"}) {
        if (data.contains(key)) it->second[key] = data.at(key);
    }
    if (data.contains("preferences")) {
        if (!data.at("preferences").is_object()) {
            throw std::invalid_argument("preferences must be an object");
        }
        it->second["preferences"].merge_patch(data.at("preferences"));
    }
    it->second["updatedAt"] = now_ms();
    return it->second;
}

} // namespace HostBus::Bridge
