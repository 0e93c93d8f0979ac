/**
 * \file message/Envelope.hpp
 * \brief Typed JSON envelope exchanged over the bus.
 * \ingroup message_module
 */
#pragma once

#include "MessageType.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <nlohmann/json.hpp>

namespace HostBus {

/**
 * \brief One protocol message: `{type, id?, timestamp, ...fields}`.
 * \ingroup message_module
 *
 * `type`, `id` and `timestamp` are held as members; every other top-level key of the
 * JSON object lives in `fields()`. An envelope is built once per send and treated as
 * immutable after serialization.
 */
class Envelope {
public:
    Envelope() = default;
    /** \brief Build without stamping an id; `timestamp` is set to now. */
    explicit Envelope(MessageType type, nlohmann::json fields = nlohmann::json::object());

    /** \brief Build with a fresh `msg_<ms>_<base36>` id and the current timestamp. */
    static Envelope create(MessageType type, nlohmann::json fields = nlohmann::json::object());

    /**
     * \brief Parse one serialized envelope.
     * \param text JSON text of a single object.
     * \param error Receives the reason when parsing fails.
     * \return The envelope, or nullopt for malformed JSON, a non-object, or an unknown `type`.
     */
    static std::optional<Envelope> parse(std::string_view text, std::string& error);

    /** \brief Compact JSON form sent on the wire. */
    std::string serialize() const;
    nlohmann::json to_json() const;

    MessageType type() const { return type_; }
    const std::string& id() const { return id_; }
    int64_t timestamp() const { return timestamp_; }
    const nlohmann::json& fields() const { return fields_; }
    nlohmann::json& fields() { return fields_; }

    bool contains(const std::string& key) const { return fields_.contains(key); }

    /** \brief Typed field lookup falling back to `fallback` if absent or of another type. */
    template <typename T>
    T value(const std::string& key, const T& fallback) const {
        auto it = fields_.find(key);
        if (it == fields_.end() || it->is_null()) return fallback;
        try {
            return it->template get<T>();
        } catch (const nlohmann::json::type_error&) {
            return fallback;
        }
    }

    /** \brief Field as string; empty when missing or not a string. */
    std::string string_field(const std::string& key) const;

    void set_id(std::string id) { id_ = std::move(id); }

    static std::string generate_id();
    static int64_t now_ms();

private:
    MessageType type_{MessageType::SYSTEM_STATUS};
    std::string id_;
    int64_t timestamp_{0};
    nlohmann::json fields_ = nlohmann::json::object();
};

} // namespace HostBus
