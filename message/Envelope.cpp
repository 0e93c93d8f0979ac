#include "Envelope.hpp"

#include <chrono>
#include <random>

namespace HostBus {

namespace {
constexpr char kBase36[] = "0123456789abcdefghijklmnopqrstuvwxyz";
}

Envelope::Envelope(MessageType type, nlohmann::json fields)
    : type_(type), timestamp_(now_ms()), fields_(std::move(fields)) {
    if (!fields_.is_object()) {
        fields_ = nlohmann::json::object();
    }
}

Envelope Envelope::create(MessageType type, nlohmann::json fields) {
    Envelope env(type, std::move(fields));
    env.id_ = generate_id();
    return env;
}

int64_t Envelope::now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

std::string Envelope::generate_id() {
    thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<int> pick(0, 35);
    std::string suffix(9, '0');
    for (auto& c : suffix) c = kBase36[pick(rng)];
    return "msg_" + std::to_string(now_ms()) + "_" + suffix;
}

std::optional<Envelope> Envelope::parse(std::string_view text, std::string& error) {
    nlohmann::json doc = nlohmann::json::parse(text, nullptr, false);
    if (doc.is_discarded()) {
        error = "malformed JSON";
        return std::nullopt;
    }
    if (!doc.is_object()) {
        error = "envelope must be a JSON object";
        return std::nullopt;
    }
    auto type_it = doc.find("type");
    if (type_it == doc.end() || !type_it->is_string()) {
        error = "envelope has no string 'type'";
        return std::nullopt;
    }
    const auto type_name = type_it->get<std::string>();
    auto type = message_type_from_string(type_name);
    if (!type) {
        error = "unknown message type '" + type_name + "'";
        return std::nullopt;
    }

    Envelope env;
    env.type_ = *type;
    if (auto id_it = doc.find("id"); id_it != doc.end() && id_it->is_string()) {
        env.id_ = id_it->get<std::string>();
    }
    if (auto ts_it = doc.find("timestamp"); ts_it != doc.end() && ts_it->is_number()) {
        env.timestamp_ = ts_it->get<int64_t>();
    }
    doc.erase("type");
    doc.erase("id");
    doc.erase("timestamp");
    env.fields_ = std::move(doc);
    return env;
}

nlohmann::json Envelope::to_json() const {
    nlohmann::json out = fields_;
    out["type"] = to_string(type_);
    if (!id_.empty()) out["id"] = id_;
    out["timestamp"] = timestamp_;
    return out;
}

std::string Envelope::serialize() const {
    // Worker output may carry invalid UTF-8; replace rather than throw.
    return to_json().dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

std::string Envelope::string_field(const std::string& key) const {
    auto it = fields_.find(key);
    if (it == fields_.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

} // namespace HostBus
