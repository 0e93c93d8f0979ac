#include "MessageRouter.hpp"

#include "message/Frame.hpp"

namespace bus {

using HostBus::Envelope;
using HostBus::MessageType;

MessageRouter::MessageRouter(ClientRegistry& registry, std::shared_ptr<Logger> logger)
    : registry_(registry), logger_(std::move(logger)) {}

void MessageRouter::on(MessageType type, Handler handler) {
    std::lock_guard<std::mutex> lk(handlers_mutex_);
    if (handler) {
        handlers_[type] = std::move(handler);
    } else {
        handlers_.erase(type);
    }
}

bool MessageRouter::is_worker_output(MessageType type) {
    switch (type) {
        case MessageType::CHAT_RESPONSE:
        case MessageType::CHAT_ERROR:
        case MessageType::CHAT_STREAM_START:
        case MessageType::CHAT_STREAM_CHUNK:
        case MessageType::CHAT_STREAM_END:
        case MessageType::AGENT_THOUGHT:
        case MessageType::AGENT_TOOL_CALL:
        case MessageType::AGENT_TOOL_RESULT:
        case MessageType::AGENT_STEP:
            return true;
        default:
            return false;
    }
}

std::size_t MessageRouter::broadcast_to_renderers(const Envelope& envelope) {
    const auto frame = HostBus::encode_frame(HostBus::FrameKind::Data, envelope.serialize());
    return registry_.deliver(frame, [](const ClientSession& s) { return s.role() == ClientRole::Renderer; });
}

std::size_t MessageRouter::send_to_worker(const Envelope& envelope) {
    const auto frame = HostBus::encode_frame(HostBus::FrameKind::Data, envelope.serialize());
    return registry_.deliver(frame, [](const ClientSession& s) { return s.role() == ClientRole::PythonAgent; });
}

void MessageRouter::route(const std::shared_ptr<ClientSession>& from, const Envelope& envelope) {
    const MessageType type = envelope.type();

    if (type == MessageType::PING) {
        from->send(Envelope::create(MessageType::PONG));
        return;
    }
    if (type == MessageType::PONG) {
        return;
    }

    if (type == MessageType::CLIENT_IDENTIFY) {
        const auto requested = envelope.string_field("clientType");
        auto role = client_role_from_string(requested);
        if (!role) {
            logger_->warning("Client " + from->id() + ": unknown clientType '" + requested + "', keeping " +
                             to_string(from->role()));
            return;
        }
        from->set_role(*role);
        logger_->info("Client " + from->id() + " identified as " + to_string(*role));
        if (*role == ClientRole::PythonAgent) {
            broadcast_to_renderers(Envelope::create(MessageType::PYTHON_STATUS, {{"status", "running"}}));
        }
        return;
    }

    if (type == MessageType::CHAT_MESSAGE || type == MessageType::AGENT_CHAT) {
        if (from->role() == ClientRole::Renderer) {
            if (send_to_worker(envelope) == 0) {
                logger_->warning("Client " + from->id() + ": " + HostBus::to_string(type) +
                                 " dropped, no worker connected");
                from->send(Envelope::create(MessageType::CHAT_RESPONSE, {
                    {"success", false},
                    {"content", "The agent service is not connected"},
                    {"conversationId", envelope.fields().value("conversationId", nlohmann::json(nullptr))},
                }));
            }
            return;
        }
    }

    if (from->role() == ClientRole::PythonAgent && is_worker_output(type)) {
        broadcast_to_renderers(envelope);
        return;
    }

    Handler handler;
    {
        std::lock_guard<std::mutex> lk(handlers_mutex_);
        auto it = handlers_.find(type);
        if (it != handlers_.end()) handler = it->second;
    }
    if (!handler) {
        logger_->debug("Client " + from->id() + ": no handler for " + HostBus::to_string(type) + ", dropped");
        return;
    }
    handler(from->id(), envelope);
}

void MessageRouter::client_closed(const ClientSession& session) {
    if (session.role() != ClientRole::PythonAgent) return;
    if (registry_.has_role(ClientRole::PythonAgent)) return;
    logger_->info("Worker connection " + session.id() + " closed");
    broadcast_to_renderers(Envelope::create(MessageType::PYTHON_STATUS, {{"status", "stopped"}}));
}

} // namespace bus
