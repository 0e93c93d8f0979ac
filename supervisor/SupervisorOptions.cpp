// SupervisorOptions.cpp - worker launch options provider with auto-registration
#include "SupervisorOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace {
    std::mutex g_sup_opts_mtx;
    std::string g_service_dir;
    std::string g_python_path;
    std::string g_venv_path;
    std::string g_script;
    int g_port = supervisor::kDefaultServicePort;
    std::string g_work_dir;
    bool g_auto_restart = true;
    int g_max_restarts = 3;
    std::vector<int> g_no_restart_codes;
    std::atomic<bool> g_sup_registered{false};

    /// Relative paths in the config file are taken relative to the file itself.
    std::string resolve_config_path(const std::string& value) {
        if (value.empty()) return value;
        std::filesystem::path p(value);
        if (p.is_relative()) {
            if (auto dir = shared_opts::Options::get_config_dir()) {
                return (*dir / p).lexically_normal().string();
            }
        }
        return value;
    }
}

namespace supervisor_opts {

void register_options() {
    bool expected = false;
    if (!g_sup_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }

    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        using shared_opts::json_value;
        {
            std::lock_guard<std::mutex> lk(g_sup_opts_mtx);
            g_service_dir = resolve_config_path(json_value<std::string>(j, "supervisor", "service_dir").value_or(""));
            g_python_path = resolve_config_path(json_value<std::string>(j, "supervisor", "python_path").value_or(""));
            g_venv_path = resolve_config_path(json_value<std::string>(j, "supervisor", "venv_path").value_or(""));
            g_script = json_value<std::string>(j, "supervisor", "script").value_or("");
            g_port = json_value<int>(j, "supervisor", "port").value_or(supervisor::kDefaultServicePort);
            g_work_dir = resolve_config_path(json_value<std::string>(j, "supervisor", "work_dir").value_or(""));
            g_auto_restart = json_value<bool>(j, "supervisor", "auto_restart").value_or(true);
            g_max_restarts = json_value<int>(j, "supervisor", "max_restarts").value_or(3);
            g_no_restart_codes.clear();
            if (j.contains("supervisor") && j["supervisor"].contains("no_restart_exit_codes")) {
                const auto& codes = j["supervisor"]["no_restart_exit_codes"];
                if (codes.is_array()) {
                    for (const auto& c : codes) {
                        if (c.is_number_integer()) g_no_restart_codes.push_back(c.get<int>());
                    }
                }
            }
        }

        app.add_option("--service-dir", g_service_dir, "Directory containing the worker service")
            ->group("Supervisor");
        app.add_option("--python-path", g_python_path, "Interpreter used to run the worker")
            ->group("Supervisor");
        app.add_option("--venv-path", g_venv_path, "Virtual environment providing bin/python")
            ->group("Supervisor");
        app.add_option("--service-script", g_script, "Entry script, relative to the service dir (default main.py)")
            ->group("Supervisor");
        app.add_option("--service-port", g_port, "Port passed to the worker as SERVICE_PORT")
            ->check(CLI::Range(1, 65535))
            ->group("Supervisor");
        app.add_option("--work-dir", g_work_dir, "Working directory of the worker (default service dir)")
            ->group("Supervisor");
        app.add_option("--auto-restart", g_auto_restart, "Restart the worker after an unexpected exit")
            ->group("Supervisor");
        app.add_option("--max-restarts", g_max_restarts, "Automatic restarts before giving up")
            ->check(CLI::NonNegativeNumber)
            ->group("Supervisor");
        app.add_option("--no-restart-exit-code", g_no_restart_codes,
                       "Exit code treated as a deliberate shutdown (repeatable)")
            ->group("Supervisor");
    });
}

supervisor::ServiceConfig get_service_config() {
    std::lock_guard<std::mutex> lk(g_sup_opts_mtx);
    supervisor::ServiceConfig cfg;
    cfg.service_dir = g_service_dir;
    cfg.python_path = g_python_path;
    cfg.venv_path = g_venv_path;
    cfg.script_path = g_script;
    cfg.port = static_cast<uint16_t>(g_port);
    cfg.work_dir = g_work_dir;
    cfg.auto_restart = g_auto_restart;
    cfg.max_restarts = g_max_restarts;
    cfg.no_restart_exit_codes = g_no_restart_codes;
    return cfg;
}

} // namespace supervisor_opts

// Static auto-registration object
namespace {
    struct SupervisorOptsAutoReg {
        SupervisorOptsAutoReg() { supervisor_opts::register_options(); }
    };
    [[maybe_unused]] static SupervisorOptsAutoReg s_supervisor_auto_reg;
}
