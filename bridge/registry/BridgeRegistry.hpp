/**
 * @file bridge/registry/BridgeRegistry.hpp
 * @brief Allow-list of host methods callable by the worker, with dispatch.
 *
 * Only methods registered here can be reached through `execute`; anything else is
 * rejected before a service object is touched.
 */
#pragma once

#include "BridgeTypes.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

class Logger;

namespace HostBus::Bridge {

/**
 * @brief Central registry of bridge methods: metadata, handlers and dispatch.
 *
 * Registration happens once during startup, after which the registry is sealed and
 * becomes read-only. `execute` may be called concurrently from any thread.
 */
class BridgeRegistry {
public:
    explicit BridgeRegistry(std::shared_ptr<Logger> logger = nullptr);

    BridgeRegistry(const BridgeRegistry&) = delete;
    BridgeRegistry& operator=(const BridgeRegistry&) = delete;
    BridgeRegistry(BridgeRegistry&&) = delete;
    BridgeRegistry& operator=(BridgeRegistry&&) = delete;

    // =========================================================================
    // Registration
    // =========================================================================

    /**
     * @brief Add one method.
     * @throws std::logic_error after `seal()`.
     * @throws std::invalid_argument for an empty name, a missing handler or a duplicate.
     */
    void register_method(BridgeMethodDescriptor descriptor);

    /** @brief Freeze the table; further registration throws. */
    void seal();
    [[nodiscard]] bool sealed() const;

    // =========================================================================
    // Query
    // =========================================================================

    /** @brief Descriptor for `service.method`, or nullptr when not allow-listed. */
    [[nodiscard]] const BridgeMethodDescriptor* find_method(const std::string& service,
                                                            const std::string& method) const;

    /** @brief Methods in registration order, optionally limited to one service. */
    [[nodiscard]] std::vector<const BridgeMethodDescriptor*> list_methods(
        const std::optional<std::string>& service = std::nullopt) const;

    /** @brief Service names in first-registration order. */
    [[nodiscard]] std::vector<std::string> services() const;

    [[nodiscard]] std::size_t method_count() const;

    // =========================================================================
    // Dispatch
    // =========================================================================

    /**
     * @brief Validate and run `service.method` with named `params`.
     *
     * Never throws: unknown services and methods, parameter problems and handler
     * exceptions all come back as a failed result.
     */
    [[nodiscard]] BridgeCallResult execute(const std::string& service,
                                           const std::string& method,
                                           const nlohmann::json& params) const noexcept;

    // =========================================================================
    // Documentation
    // =========================================================================

    /** @brief Markdown description of one method. */
    [[nodiscard]] static std::string method_description(const BridgeMethodDescriptor& descriptor);

    /** @brief Markdown capability document covering every registered method. */
    [[nodiscard]] std::string capability_prompt() const;

private:
    /// Maps named params onto handler arguments; returns an error text on failure.
    static std::optional<std::string> build_arguments(const BridgeMethodDescriptor& descriptor,
                                                      const nlohmann::json& params,
                                                      std::vector<nlohmann::json>& args);
    void log_debug(const std::string& message) const;

    std::shared_ptr<Logger> logger_;
    mutable std::mutex mutex_;
    bool sealed_{false};
    std::vector<BridgeMethodDescriptor> methods_;
    std::map<std::pair<std::string, std::string>, std::size_t> index_;
    std::vector<std::string> services_;
};

} // namespace HostBus::Bridge
