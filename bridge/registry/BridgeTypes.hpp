/**
 * @file bridge/registry/BridgeTypes.hpp
 * @brief Value types describing allow-listed bridge methods and call outcomes.
 */
#pragma once

#include <functional>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace HostBus::Bridge {

/** @brief Declared JSON type of a bridge parameter. */
enum class ParamType { String, Number, Boolean, Object, Array };

inline const char* to_string(ParamType type) {
    switch (type) {
        case ParamType::String:  return "string";
        case ParamType::Number:  return "number";
        case ParamType::Boolean: return "boolean";
        case ParamType::Object:  return "object";
        case ParamType::Array:   return "array";
        default:                 return "unknown";
    }
}

/** @brief One named parameter of a bridge method. */
struct BridgeParam {
    std::string name;
    ParamType type{ParamType::String};
    bool required{false};
    std::string description;
    std::optional<nlohmann::json> default_value;  ///< Used when an optional parameter is omitted

    static BridgeParam required_param(std::string name, ParamType type, std::string description) {
        return BridgeParam{std::move(name), type, true, std::move(description), std::nullopt};
    }
    static BridgeParam optional_param(std::string name, ParamType type, std::string description,
                                      std::optional<nlohmann::json> default_value = std::nullopt) {
        return BridgeParam{std::move(name), type, false, std::move(description), std::move(default_value)};
    }

    nlohmann::json to_json() const {
        nlohmann::json j{{"name", name}, {"type", to_string(type)}, {"required", required}, {"description", description}};
        if (default_value) j["default"] = *default_value;
        return j;
    }
};

/**
 * @brief How named request parameters become handler arguments.
 *
 * - Positional: declared order; omitted optionals take their default (or null).
 * - Structured: declared order, every `object` parameter must be a JSON object and is
 *   passed whole; no defaults are substituted.
 */
enum class ArgumentStyle { Positional, Structured };

/** @brief Type-erased handler receiving arguments in declared parameter order. */
using BridgeHandler = std::function<nlohmann::json(const std::vector<nlohmann::json>& args)>;

/**
 * @brief Complete definition of one remotely callable method.
 *
 * The handler is part of the descriptor, so the registry's table is at the same time
 * the allow-list and the dispatch table.
 */
struct BridgeMethodDescriptor {
    std::string service;
    std::string method;
    std::string description;
    std::vector<BridgeParam> params;
    std::string returns;
    std::string example;
    ArgumentStyle style{ArgumentStyle::Positional};
    BridgeHandler handler;

    std::string qualified_name() const { return service + "." + method; }

    /** @brief Metadata without the handler, as sent in list responses. */
    nlohmann::json to_json() const {
        nlohmann::json p = nlohmann::json::array();
        for (const auto& param : params) p.push_back(param.to_json());
        return nlohmann::json{{"service", service}, {"method", method}, {"description", description},
                              {"params", std::move(p)}, {"returns", returns}, {"example", example}};
    }
};

/** @brief Outcome of one `execute` call. */
struct BridgeCallResult {
    bool success{false};
    nlohmann::json result;   ///< Set when success
    std::string error;       ///< Set when !success

    static BridgeCallResult ok(nlohmann::json value) {
        return BridgeCallResult{true, std::move(value), {}};
    }
    static BridgeCallResult fail(std::string message) {
        return BridgeCallResult{false, nullptr, std::move(message)};
    }

    nlohmann::json to_json() const {
        if (success) return nlohmann::json{{"success", true}, {"result", result}};
        return nlohmann::json{{"success", false}, {"error", error}};
    }
};

} // namespace HostBus::Bridge
