#include "BridgeEndpoint.hpp"

#include <optional>
#include <stdexcept>

namespace host {

using HostBus::Envelope;
using HostBus::MessageType;

namespace {
nlohmann::json request_id_of(const Envelope& e) {
    auto it = e.fields().find("requestId");
    return it == e.fields().end() ? nlohmann::json(nullptr) : *it;
}
}

BridgeEndpoint::BridgeEndpoint(bus::MessageBus& bus, const HostBus::Bridge::BridgeRegistry& registry,
                               std::shared_ptr<Logger> logger)
    : bus_(bus), registry_(registry), logger_(std::move(logger)) {
    if (!logger_) throw std::invalid_argument("BridgeEndpoint requires a logger");
}

void BridgeEndpoint::attach() {
    if (!registry_.sealed()) {
        throw std::logic_error("BridgeEndpoint: registry must be sealed before serving");
    }
    bus_.on(MessageType::FRONTEND_BRIDGE_REQUEST, [this](const std::string& client_id, const Envelope& e) {
        if (!bus_.send_to_client(client_id, handle_request(e))) {
            logger_->warning("Bridge: response to " + client_id + " could not be delivered");
        }
    });
    bus_.on(MessageType::FRONTEND_BRIDGE_LIST, [this](const std::string& client_id, const Envelope& e) {
        if (!bus_.send_to_client(client_id, handle_list(e))) {
            logger_->warning("Bridge: method list for " + client_id + " could not be delivered");
        }
    });
    logger_->info("Bridge: serving " + std::to_string(registry_.method_count()) + " methods on the bus");
}

Envelope BridgeEndpoint::handle_request(const Envelope& request) const {
    const auto service = request.string_field("service");
    const auto method = request.string_field("method");
    const auto request_id = request_id_of(request);

    nlohmann::json reply;
    if (service.empty() || method.empty()) {
        reply = {{"success", false}, {"error", "Bridge request needs 'service' and 'method'"}};
    } else {
        auto params = request.fields().value("params", nlohmann::json::object());
        if (params.is_null()) params = nlohmann::json::object();
        const auto result = registry_.execute(service, method, params);
        if (!result.success) {
            logger_->warning("Bridge: " + service + "." + method + " failed: " + result.error);
        } else {
            logger_->debug("Bridge: " + service + "." + method + " ok");
        }
        reply = result.to_json();
    }
    reply["requestId"] = request_id;
    return Envelope::create(MessageType::FRONTEND_BRIDGE_RESPONSE, std::move(reply));
}

Envelope BridgeEndpoint::handle_list(const Envelope& request) const {
    std::optional<std::string> service;
    if (auto s = request.string_field("service"); !s.empty()) service = s;

    nlohmann::json methods = nlohmann::json::array();
    for (const auto* d : registry_.list_methods(service)) methods.push_back(d->to_json());
    const auto count = methods.size();
    return Envelope::create(MessageType::FRONTEND_BRIDGE_LIST_RESPONSE, {
        {"success", true},
        {"methods", std::move(methods)},
        {"count", count},
        {"requestId", request_id_of(request)},
    });
}

} // namespace host
