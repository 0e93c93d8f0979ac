/**
 * @file bridge/registry/BridgeRegistry.cpp
 * @brief Implementation of the bridge allow-list and dispatcher.
 */
#include "BridgeRegistry.hpp"
#include "BridgeInvoker.hpp"
#include "logger.hpp"

#include <sstream>
#include <stdexcept>

namespace HostBus::Bridge {

namespace {

bool matches_type(const nlohmann::json& value, ParamType type) {
    switch (type) {
        case ParamType::String:  return value.is_string();
        case ParamType::Number:  return value.is_number();
        case ParamType::Boolean: return value.is_boolean();
        case ParamType::Object:  return value.is_object();
        case ParamType::Array:   return value.is_array();
    }
    return false;
}

std::string join(const std::vector<std::string>& items) {
    std::string out;
    for (const auto& item : items) {
        if (!out.empty()) out += ", ";
        out += item;
    }
    return out;
}

} // namespace

BridgeRegistry::BridgeRegistry(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
{
}

void BridgeRegistry::register_method(BridgeMethodDescriptor descriptor) {
    if (descriptor.service.empty() || descriptor.method.empty()) {
        throw std::invalid_argument("bridge method needs a service and a method name");
    }
    if (!descriptor.handler) {
        throw std::invalid_argument("bridge method " + descriptor.qualified_name() + " has no handler");
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (sealed_) {
        throw std::logic_error("bridge registry is sealed, cannot register " + descriptor.qualified_name());
    }
    auto key = std::make_pair(descriptor.service, descriptor.method);
    if (index_.count(key) != 0) {
        throw std::invalid_argument("bridge method " + descriptor.qualified_name() + " registered twice");
    }
    bool known_service = false;
    for (const auto& s : services_) {
        if (s == descriptor.service) { known_service = true; break; }
    }
    if (!known_service) services_.push_back(descriptor.service);

    log_debug("Registered " + descriptor.qualified_name());
    index_.emplace(std::move(key), methods_.size());
    methods_.push_back(std::move(descriptor));
}

void BridgeRegistry::seal() {
    std::lock_guard<std::mutex> lock(mutex_);
    sealed_ = true;
}

bool BridgeRegistry::sealed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return sealed_;
}

const BridgeMethodDescriptor* BridgeRegistry::find_method(const std::string& service,
                                                          const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = index_.find(std::make_pair(service, method));
    if (it == index_.end()) return nullptr;
    return &methods_[it->second];
}

std::vector<const BridgeMethodDescriptor*> BridgeRegistry::list_methods(
    const std::optional<std::string>& service) const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<const BridgeMethodDescriptor*> result;
    for (const auto& m : methods_) {
        if (!service || m.service == *service) result.push_back(&m);
    }
    return result;
}

std::vector<std::string> BridgeRegistry::services() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return services_;
}

std::size_t BridgeRegistry::method_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return methods_.size();
}

std::optional<std::string> BridgeRegistry::build_arguments(const BridgeMethodDescriptor& descriptor,
                                                           const nlohmann::json& params,
                                                           std::vector<nlohmann::json>& args) {
    args.clear();
    args.reserve(descriptor.params.size());
    for (const auto& p : descriptor.params) {
        auto it = params.find(p.name);
        const bool present = it != params.end() && !it->is_null();
        if (!present) {
            if (p.required) {
                return "Missing required parameter '" + p.name + "' for " + descriptor.qualified_name();
            }
            if (descriptor.style == ArgumentStyle::Positional && p.default_value) {
                args.push_back(*p.default_value);
            } else {
                args.emplace_back(nullptr);
            }
            continue;
        }
        if (!matches_type(*it, p.type)) {
            return "Parameter '" + p.name + "' of " + descriptor.qualified_name() +
                   " must be of type " + to_string(p.type);
        }
        args.push_back(*it);
    }
    return std::nullopt;
}

BridgeCallResult BridgeRegistry::execute(const std::string& service,
                                         const std::string& method,
                                         const nlohmann::json& params) const noexcept {
    try {
        BridgeMethodDescriptor descriptor;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = index_.find(std::make_pair(service, method));
            if (it == index_.end()) {
                bool known_service = false;
                for (const auto& s : services_) {
                    if (s == service) { known_service = true; break; }
                }
                if (!known_service) {
                    log_debug("Rejected call to unknown service " + service);
                    return BridgeCallResult::fail("Service '" + service +
                                                  "' does not exist. Available services: " + join(services_));
                }
                std::vector<std::string> names;
                for (const auto& m : methods_) {
                    if (m.service == service) names.push_back(m.method);
                }
                log_debug("Rejected call to non allow-listed " + service + "." + method);
                return BridgeCallResult::fail("Method '" + service + "." + method +
                                              "' is not registered in bridge registry, call forbidden. "
                                              "Available methods: " + join(names));
            }
            descriptor = methods_[it->second];
        }

        if (!params.is_null() && !params.is_object()) {
            return BridgeCallResult::fail("params for " + descriptor.qualified_name() + " must be a JSON object");
        }
        const nlohmann::json named = params.is_object() ? params : nlohmann::json::object();

        std::vector<nlohmann::json> args;
        if (auto problem = build_arguments(descriptor, named, args)) {
            return BridgeCallResult::fail(*problem);
        }

        // Handler runs outside the lock; it may block on service state.
        nlohmann::json result = descriptor.handler(args);
        log_debug("Executed " + descriptor.qualified_name());
        return BridgeCallResult::ok(std::move(result));
    } catch (const ArgumentError& e) {
        return BridgeCallResult::fail("Invalid arguments for " + service + "." + method + ": " + e.what());
    } catch (const std::exception& e) {
        if (logger_) logger_->warning("[BridgeRegistry] " + service + "." + method + " failed: " + e.what());
        return BridgeCallResult::fail(e.what());
    } catch (...) {
        if (logger_) logger_->warning("[BridgeRegistry] " + service + "." + method + " failed with a non-standard exception");
        return BridgeCallResult::fail("unknown error");
    }
}

std::string BridgeRegistry::method_description(const BridgeMethodDescriptor& descriptor) {
    std::ostringstream out;
    out << "### " << descriptor.qualified_name() << "\n\n"
        << descriptor.description << "\n\n"
        << "Params:\n";
    if (descriptor.params.empty()) {
        out << "  (none)";
    } else {
        bool first = true;
        for (const auto& p : descriptor.params) {
            if (!first) out << "\n";
            first = false;
            out << "  - " << p.name << " (" << to_string(p.type) << ", "
                << (p.required ? "required" : "optional") << "): " << p.description;
            if (p.default_value) out << ", default: " << p.default_value->dump();
        }
    }
    out << "\n\nReturns: " << descriptor.returns;
    if (!descriptor.example.empty()) {
        out << "\nExample params: " << descriptor.example;
    }
    return out.str();
}

std::string BridgeRegistry::capability_prompt() const {
    std::string sections;
    for (const auto* m : list_methods()) {
        if (!sections.empty()) sections += "\n\n---\n\n";
        sections += method_description(*m);
    }

    std::ostringstream out;
    out << "# Frontend service bridge tool\n\n"
        << "The following host services can be called through the frontend_bridge tool:\n\n"
        << "---\n\n"
        << sections << "\n\n"
        << "## Usage\n\n"
        << "1. Call format: frontend_bridge(service=\"xxx\", method=\"xxx\", params={...})\n"
        << "2. params must be a JSON object whose keys match the parameter names above\n"
        << "3. The call returns the method result, or an error message when it fails\n";
    return out.str();
}

void BridgeRegistry::log_debug(const std::string& message) const {
    if (logger_) {
        logger_->debug("[BridgeRegistry] " + message);
    }
}

} // namespace HostBus::Bridge
