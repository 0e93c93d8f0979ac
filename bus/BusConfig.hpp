/**
 * \file bus/BusConfig.hpp
 * \brief Configuration and status values of the socket message bus.
 * \ingroup bus_module
 */
#pragma once

#include "message/Frame.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace bus {

/** \brief Role a peer announced through `CLIENT_IDENTIFY`. */
enum class ClientRole { Renderer, PythonAgent };

inline const char* to_string(ClientRole role) {
    return role == ClientRole::PythonAgent ? "python_agent" : "renderer";
}

inline std::optional<ClientRole> client_role_from_string(const std::string& text) {
    if (text == "renderer") return ClientRole::Renderer;
    if (text == "python_agent") return ClientRole::PythonAgent;
    return std::nullopt;
}

/** \brief Server parameters; the defaults bind an ephemeral loopback port. */
struct BusConfig {
    std::string host{"127.0.0.1"};
    int port{0};
    std::chrono::milliseconds heartbeat_interval{30000};
    int backlog{128};
    std::size_t io_threads{1};
    uint32_t max_frame_body{HostBus::kDefaultMaxFrameBody};
    /// Timeout of one blocking frame write to a peer.
    std::chrono::milliseconds write_timeout{5000};
};

/** \brief Address the bus actually listens on. */
struct BusEndpoint {
    std::string host;
    int port{0};
};

/** \brief Snapshot returned by `MessageBus::get_server_info()`. */
struct ServerInfo {
    bool running{false};
    std::string host;
    int port{0};
    std::size_t client_count{0};
    bool worker_connected{false};

    nlohmann::json to_json() const {
        return nlohmann::json{{"running", running}, {"host", host}, {"port", port},
                              {"clientCount", client_count}, {"workerConnected", worker_connected}};
    }
};

} // namespace bus
