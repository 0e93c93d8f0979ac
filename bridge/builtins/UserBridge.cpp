/**
 * @file bridge/builtins/UserBridge.cpp
 * @brief `userService` entries of the bridge catalog.
 */
#include "BuiltinBridges.hpp"
#include "bridge/registry/BridgeInvoker.hpp"

#include <stdexcept>

namespace HostBus::Bridge {

void register_user_bridge(BridgeRegistry& registry, std::shared_ptr<IUserService> service) {
    if (!service) {
        throw std::invalid_argument("register_user_bridge: null service");
    }

    registry.register_method({
        "userService", "getCurrentUser",
        "Get the profile of a user",
        {BridgeParam::required_param("userId", ParamType::Number, "User id")},
        "The user profile, or null when it does not exist",
        R"({"userId": 1})",
        ArgumentStyle::Positional,
        make_bridge_handler<int64_t>([service](int64_t id) { return service->get_current_user(id); }),
    });

    registry.register_method({
        "userService", "updateProfile",
        "Update profile fields of a user",
        {
            BridgeParam::required_param("userId", ParamType::Number, "User id"),
            BridgeParam::required_param("data", ParamType::Object,
                                        "Fields to change: username, displayName, email, avatar, preferences"),
        },
        "The updated user profile",
        R"({"userId": 1, "data": {"displayName": "Ada"}})",
        ArgumentStyle::Structured,
        make_bridge_handler<int64_t, nlohmann::json>([service](int64_t id, const nlohmann::json& data) {
            return service->update_profile(id, data);
        }),
    });
}

} // namespace HostBus::Bridge
