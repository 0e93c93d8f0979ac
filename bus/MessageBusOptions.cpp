// MessageBusOptions.cpp - bus listen options provider with auto-registration
#include "MessageBusOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace {
    std::mutex g_bus_opts_mtx;
    std::string g_bus_host = "127.0.0.1";
    int g_bus_port = 0;
    int g_bus_heartbeat_ms = 30000;
    int g_bus_io_threads = 1;
    std::atomic<bool> g_bus_registered{false};
}

namespace message_bus_opts {

void register_options() {
    bool expected = false;
    if (!g_bus_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        using shared_opts::json_value;
        {
            std::lock_guard<std::mutex> lk(g_bus_opts_mtx);
            g_bus_host = json_value<std::string>(j, "message_bus", "host").value_or("127.0.0.1");
            g_bus_port = json_value<int>(j, "message_bus", "port").value_or(0);
            g_bus_heartbeat_ms = json_value<int>(j, "message_bus", "heartbeat_ms").value_or(30000);
            const int threads = json_value<int>(j, "message_bus", "io_threads").value_or(1);
            g_bus_io_threads = threads > 0 ? threads : 1;
        }

        app.add_option("--bus-host", g_bus_host, "Bus listen address (default 127.0.0.1)")
            ->group("Message bus");
        app.add_option("--bus-port", g_bus_port, "Bus listen port, 0 for an ephemeral port")
            ->check(CLI::Range(0, 65535))
            ->group("Message bus");
        app.add_option("--bus-heartbeat-ms", g_bus_heartbeat_ms, "Heartbeat interval; idle peers are dropped after twice this")
            ->check(CLI::PositiveNumber)
            ->group("Message bus");
        app.add_option("--bus-io-threads", g_bus_io_threads, "Threads running the bus I/O loop (default 1)")
            ->check(CLI::Range(1, 64))
            ->group("Message bus");
    });
}

bus::BusConfig get_bus_config() {
    std::lock_guard<std::mutex> lk(g_bus_opts_mtx);
    bus::BusConfig cfg;
    cfg.host = g_bus_host;
    cfg.port = g_bus_port;
    cfg.heartbeat_interval = std::chrono::milliseconds(g_bus_heartbeat_ms);
    cfg.io_threads = static_cast<std::size_t>(g_bus_io_threads);
    return cfg;
}

} // namespace message_bus_opts

// Static auto-registration object
namespace {
    struct MessageBusOptsAutoReg {
        MessageBusOptsAutoReg() { message_bus_opts::register_options(); }
    };
    [[maybe_unused]] static MessageBusOptsAutoReg s_message_bus_auto_reg;
}
