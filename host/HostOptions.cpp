// HostOptions.cpp - host process options provider with auto-registration
#include "HostOptions.hpp"
#include "logger.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>

namespace {
    std::mutex g_host_opts_mtx;
    std::string g_log_level = "info";
    bool g_auto_start = true;
    int g_wait_ready_ms = 30000;
    std::atomic<bool> g_host_registered{false};
}

namespace host_opts {

void register_options() {
    bool expected = false;
    if (!g_host_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        using shared_opts::json_value;
        {
            std::lock_guard<std::mutex> lk(g_host_opts_mtx);
            g_log_level = json_value<std::string>(j, "host", "log_level").value_or("info");
            g_auto_start = json_value<bool>(j, "host", "auto_start_service").value_or(true);
            g_wait_ready_ms = json_value<int>(j, "host", "wait_ready_ms").value_or(30000);
        }

        app.add_option("--log-level", g_log_level, "debug, info, warning, error or critical")
            ->check([](const std::string& v) {
                return parse_log_level(v) ? std::string() : "unknown log level '" + v + "'";
            })
            ->group("Host");
        app.add_option("--auto-start-service", g_auto_start, "Launch the worker at startup")
            ->group("Host");
        app.add_option("--wait-ready-ms", g_wait_ready_ms, "Wait for the worker HTTP API after launch (0 = don't wait)")
            ->check(CLI::NonNegativeNumber)
            ->group("Host");
    });
}

HostSettings get_settings() {
    std::lock_guard<std::mutex> lk(g_host_opts_mtx);
    HostSettings s;
    s.log_level = g_log_level;
    s.auto_start_service = g_auto_start;
    s.wait_ready = std::chrono::milliseconds(g_wait_ready_ms);
    return s;
}

} // namespace host_opts

// Static auto-registration object
namespace {
    struct HostOptsAutoReg {
        HostOptsAutoReg() { host_opts::register_options(); }
    };
    [[maybe_unused]] static HostOptsAutoReg s_host_auto_reg;
}
