/**
 * @file bridge/registry/BridgeInvoker.hpp
 * @brief Binds typed C++ callables to the JSON-argument `BridgeHandler` signature.
 *
 * @code
 * auto h = make_bridge_handler<std::string, std::optional<std::string>>(
 *     [svc](const std::string& name, const std::optional<std::string>& desc) {
 *         return svc->create_knowledge(name, desc);
 *     });
 * @endcode
 */
#pragma once

#include "BridgeTypes.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>

namespace HostBus::Bridge {

/** @brief A bridge argument could not be decoded into the handler's parameter type. */
class ArgumentError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/** @brief Converts one JSON argument to `T`; null is rejected. */
template <typename T>
struct ArgDecoder {
    static T decode(const nlohmann::json& value, std::size_t index) {
        if (value.is_null()) {
            throw ArgumentError("argument " + std::to_string(index) + " is missing");
        }
        try {
            return value.get<T>();
        } catch (const nlohmann::json::exception& e) {
            throw ArgumentError("argument " + std::to_string(index) + " has the wrong type: " + e.what());
        }
    }
};

/** @brief Null (or absent) maps to an empty optional. */
template <typename T>
struct ArgDecoder<std::optional<T>> {
    static std::optional<T> decode(const nlohmann::json& value, std::size_t index) {
        if (value.is_null()) return std::nullopt;
        return ArgDecoder<T>::decode(value, index);
    }
};

/** @brief Raw JSON is passed through untouched. */
template <>
struct ArgDecoder<nlohmann::json> {
    static nlohmann::json decode(const nlohmann::json& value, std::size_t) { return value; }
};

namespace detail {

template <typename... Args, typename F, std::size_t... I>
nlohmann::json invoke_with_args(F& fn, const std::vector<nlohmann::json>& args, std::index_sequence<I...>) {
    using Result = std::invoke_result_t<F&, std::decay_t<Args>...>;
    if constexpr (std::is_void_v<Result>) {
        fn(ArgDecoder<std::decay_t<Args>>::decode(args[I], I)...);
        return nullptr;
    } else {
        return nlohmann::json(fn(ArgDecoder<std::decay_t<Args>>::decode(args[I], I)...));
    }
}

} // namespace detail

/**
 * @brief Wrap `fn` taking `Args...` into a `BridgeHandler`.
 *
 * The handler throws `ArgumentError` on an argument count mismatch or a decode
 * failure; the registry turns that into a failed call result.
 */
template <typename... Args, typename F>
BridgeHandler make_bridge_handler(F fn) {
    return [fn = std::move(fn)](const std::vector<nlohmann::json>& args) mutable -> nlohmann::json {
        if (args.size() != sizeof...(Args)) {
            throw ArgumentError("expected " + std::to_string(sizeof...(Args)) +
                                " argument(s), got " + std::to_string(args.size()));
        }
        return detail::invoke_with_args<Args...>(fn, args, std::index_sequence_for<Args...>{});
    };
}

} // namespace HostBus::Bridge
