#include "SupervisorRelay.hpp"

#include <stdexcept>

namespace host {

using HostBus::Envelope;
using HostBus::MessageType;

SupervisorRelay::SupervisorRelay(bus::MessageBus& bus, supervisor::ProcessSupervisor& supervisor,
                                 std::shared_ptr<Logger> logger)
    : bus_(bus), supervisor_(supervisor), logger_(std::move(logger)) {
    if (!logger_) throw std::invalid_argument("SupervisorRelay requires a logger");
}

SupervisorRelay::~SupervisorRelay() {
    detach();
}

void SupervisorRelay::attach() {
    if (attached_) return;
    supervisor_.set_status_callback([this](supervisor::ServiceStatus status, const std::string& last_error) {
        nlohmann::json fields{{"status", supervisor::to_string(status)}};
        if (!last_error.empty()) fields["error"] = last_error;
        bus_.broadcast_to_renderers(Envelope::create(MessageType::PYTHON_STATUS, std::move(fields)));
    });
    supervisor_.set_log_callback([this](const supervisor::LogEntry& entry) {
        bus_.broadcast_to_renderers(Envelope::create(MessageType::PYTHON_LOG, entry.to_json()));
    });
    bus_.on(MessageType::SYSTEM_STATUS, [this](const std::string& client_id, const Envelope&) {
        if (!bus_.send_to_client(client_id, status_snapshot())) {
            logger_->warning("Relay: status snapshot for " + client_id + " could not be delivered");
        }
    });
    attached_ = true;
}

void SupervisorRelay::detach() {
    if (!attached_) return;
    supervisor_.set_status_callback(nullptr);
    supervisor_.set_log_callback(nullptr);
    bus_.on(MessageType::SYSTEM_STATUS, nullptr);
    attached_ = false;
}

Envelope SupervisorRelay::status_snapshot() const {
    return Envelope::create(MessageType::SYSTEM_STATUS, {
        {"server", bus_.get_server_info().to_json()},
        {"service", supervisor_.get_info().to_json()},
    });
}

} // namespace host
