/**
 * \file message/MessageType.hpp
 * \brief Closed vocabulary of bus message types and their wire strings.
 * \ingroup message_module
 */
#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace HostBus {

/**
 * \defgroup message_module Message Module
 * \brief Envelope, type vocabulary and frame header shared by bus peers.
 */

/** \brief Every message type a bus peer may send. The wire form is the snake_case string. */
enum class MessageType {
    // Connection management
    CONNECTION_ACK,
    PING,
    PONG,
    CLIENT_IDENTIFY,

    // Chat
    CHAT_MESSAGE,
    CHAT_RESPONSE,
    CHAT_ERROR,
    CHAT_STREAM_START,
    CHAT_STREAM_CHUNK,
    CHAT_STREAM_END,

    // Agent
    AGENT_CHAT,
    AGENT_THOUGHT,
    AGENT_TOOL_CALL,
    AGENT_TOOL_RESULT,
    AGENT_STEP,

    // System and worker
    SYSTEM_STATUS,
    SYSTEM_ERROR,
    PYTHON_STATUS,
    PYTHON_LOG,
    MODEL_CONFIG_SYNC,

    // Model backend
    OLLAMA_STATUS,
    OLLAMA_STATUS_RESPONSE,
    OLLAMA_MODELS,
    OLLAMA_MODELS_RESPONSE,
    OLLAMA_TEST,
    OLLAMA_TEST_RESPONSE,

    // Skills
    SKILL_LIST,
    SKILL_LIST_RESPONSE,
    SKILL_EXECUTE,
    SKILL_EXECUTE_RESPONSE,
    SKILL_RELOAD,
    SKILL_RELOAD_RESPONSE,

    // Knowledge base
    KNOWLEDGE_CREATE,
    KNOWLEDGE_CREATE_RESPONSE,
    KNOWLEDGE_DELETE,
    KNOWLEDGE_DELETE_RESPONSE,
    KNOWLEDGE_LIST,
    KNOWLEDGE_LIST_RESPONSE,
    KNOWLEDGE_GET,
    KNOWLEDGE_GET_RESPONSE,
    KNOWLEDGE_ADD_DOCUMENT,
    KNOWLEDGE_ADD_DOCUMENT_RESPONSE,
    KNOWLEDGE_REMOVE_DOCUMENT,
    KNOWLEDGE_REMOVE_DOCUMENT_RESPONSE,
    KNOWLEDGE_SEARCH,
    KNOWLEDGE_SEARCH_RESPONSE,
    KNOWLEDGE_LIST_DOCUMENTS,
    KNOWLEDGE_LIST_DOCUMENTS_RESPONSE,
    KNOWLEDGE_SYNC_CREATE,
    KNOWLEDGE_SYNC_DELETE,

    // Reverse RPC bridge
    FRONTEND_BRIDGE_REQUEST,
    FRONTEND_BRIDGE_RESPONSE,
    FRONTEND_BRIDGE_LIST,
    FRONTEND_BRIDGE_LIST_RESPONSE,
};

namespace detail {
using TypeName = std::pair<MessageType, std::string_view>;
inline constexpr std::array<TypeName, 54> kMessageTypeNames{{
    {MessageType::CONNECTION_ACK, "connection_ack"},
    {MessageType::PING, "ping"},
    {MessageType::PONG, "pong"},
    {MessageType::CLIENT_IDENTIFY, "client_identify"},
    {MessageType::CHAT_MESSAGE, "chat_message"},
    {MessageType::CHAT_RESPONSE, "chat_response"},
    {MessageType::CHAT_ERROR, "chat_error"},
    {MessageType::CHAT_STREAM_START, "chat_stream_start"},
    {MessageType::CHAT_STREAM_CHUNK, "chat_stream_chunk"},
    {MessageType::CHAT_STREAM_END, "chat_stream_end"},
    {MessageType::AGENT_CHAT, "agent_chat"},
    {MessageType::AGENT_THOUGHT, "agent_thought"},
    {MessageType::AGENT_TOOL_CALL, "agent_tool_call"},
    {MessageType::AGENT_TOOL_RESULT, "agent_tool_result"},
    {MessageType::AGENT_STEP, "agent_step"},
    {MessageType::SYSTEM_STATUS, "system_status"},
    {MessageType::SYSTEM_ERROR, "system_error"},
    {MessageType::PYTHON_STATUS, "python_status"},
    {MessageType::PYTHON_LOG, "python_log"},
    {MessageType::MODEL_CONFIG_SYNC, "model_config_sync"},
    {MessageType::OLLAMA_STATUS, "ollama_status"},
    {MessageType::OLLAMA_STATUS_RESPONSE, "ollama_status_response"},
    {MessageType::OLLAMA_MODELS, "ollama_models"},
    {MessageType::OLLAMA_MODELS_RESPONSE, "ollama_models_response"},
    {MessageType::OLLAMA_TEST, "ollama_test"},
    {MessageType::OLLAMA_TEST_RESPONSE, "ollama_test_response"},
    {MessageType::SKILL_LIST, "skill_list"},
    {MessageType::SKILL_LIST_RESPONSE, "skill_list_response"},
    {MessageType::SKILL_EXECUTE, "skill_execute"},
    {MessageType::SKILL_EXECUTE_RESPONSE, "skill_execute_response"},
    {MessageType::SKILL_RELOAD, "skill_reload"},
    {MessageType::SKILL_RELOAD_RESPONSE, "skill_reload_response"},
    {MessageType::KNOWLEDGE_CREATE, "knowledge_create"},
    {MessageType::KNOWLEDGE_CREATE_RESPONSE, "knowledge_create_response"},
    {MessageType::KNOWLEDGE_DELETE, "knowledge_delete"},
    {MessageType::KNOWLEDGE_DELETE_RESPONSE, "knowledge_delete_response"},
    {MessageType::KNOWLEDGE_LIST, "knowledge_list"},
    {MessageType::KNOWLEDGE_LIST_RESPONSE, "knowledge_list_response"},
    {MessageType::KNOWLEDGE_GET, "knowledge_get"},
    {MessageType::KNOWLEDGE_GET_RESPONSE, "knowledge_get_response"},
    {MessageType::KNOWLEDGE_ADD_DOCUMENT, "knowledge_add_document"},
    {MessageType::KNOWLEDGE_ADD_DOCUMENT_RESPONSE, "knowledge_add_document_response"},
    {MessageType::KNOWLEDGE_REMOVE_DOCUMENT, "knowledge_remove_document"},
    {MessageType::KNOWLEDGE_REMOVE_DOCUMENT_RESPONSE, "knowledge_remove_document_response"},
    {MessageType::KNOWLEDGE_SEARCH, "knowledge_search"},
    {MessageType::KNOWLEDGE_SEARCH_RESPONSE, "knowledge_search_response"},
    {MessageType::KNOWLEDGE_LIST_DOCUMENTS, "knowledge_list_documents"},
    {MessageType::KNOWLEDGE_LIST_DOCUMENTS_RESPONSE, "knowledge_list_documents_response"},
    {MessageType::KNOWLEDGE_SYNC_CREATE, "knowledge_sync_create"},
    {MessageType::KNOWLEDGE_SYNC_DELETE, "knowledge_sync_delete"},
    {MessageType::FRONTEND_BRIDGE_REQUEST, "frontend_bridge_request"},
    {MessageType::FRONTEND_BRIDGE_RESPONSE, "frontend_bridge_response"},
    {MessageType::FRONTEND_BRIDGE_LIST, "frontend_bridge_list"},
    {MessageType::FRONTEND_BRIDGE_LIST_RESPONSE, "frontend_bridge_list_response"},
}};
} // namespace detail

/** \brief Wire string of `type`. */
inline std::string to_string(MessageType type) {
    for (const auto& [t, name] : detail::kMessageTypeNames) {
        if (t == type) return std::string(name);
    }
    return "unknown";
}

/** \brief Inverse of `to_string`; nullopt for strings outside the vocabulary. */
inline std::optional<MessageType> message_type_from_string(std::string_view text) {
    for (const auto& [t, name] : detail::kMessageTypeNames) {
        if (name == text) return t;
    }
    return std::nullopt;
}

} // namespace HostBus
