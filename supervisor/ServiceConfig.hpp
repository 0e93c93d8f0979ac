/**
 * \file supervisor/ServiceConfig.hpp
 * \brief Launch parameters, status values and snapshots of the supervised worker.
 * \ingroup supervisor_module
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <sys/types.h>

namespace supervisor {

/** \brief Lifecycle state of the worker process. */
enum class ServiceStatus { Stopped, Starting, Running, Stopping, Error };

inline const char* to_string(ServiceStatus s) {
    switch (s) {
        case ServiceStatus::Stopped:  return "stopped";
        case ServiceStatus::Starting: return "starting";
        case ServiceStatus::Running:  return "running";
        case ServiceStatus::Stopping: return "stopping";
        case ServiceStatus::Error:    return "error";
        default:                      return "unknown";
    }
}

/** \brief Default port handed to the worker via `SERVICE_PORT`. */
inline constexpr uint16_t kDefaultServicePort = 8765;

/**
 * \brief Declarative launch parameters.
 * \details Immutable for the duration of one launch; `restart()` may swap in a new one.
 */
struct ServiceConfig {
    std::filesystem::path python_path;   ///< Explicit interpreter; used when it exists
    std::filesystem::path venv_path;     ///< Virtual env root; `bin/python` is tried next
    std::filesystem::path service_dir;
    std::filesystem::path script_path;   ///< Empty means `<service_dir>/main.py`; relative paths resolve against service_dir
    std::vector<std::string> args;
    uint16_t port{kDefaultServicePort};
    std::filesystem::path work_dir;      ///< Empty means service_dir
    std::map<std::string, std::string> env;
    bool auto_restart{true};
    int max_restarts{3};
    std::vector<int> no_restart_exit_codes;  ///< Exit codes treated as a deliberate shutdown
};

/** \brief Supervisor timing knobs. Defaults are the production values. */
struct SupervisorTimings {
    std::chrono::milliseconds restart_delay{2000};
    std::chrono::milliseconds liveness_interval{5000};
    std::chrono::milliseconds stop_grace{10000};
    std::chrono::milliseconds restart_settle{1000};
};

/** \brief One captured worker or lifecycle log line. */
struct LogEntry {
    int64_t timestamp{0};   ///< Epoch milliseconds
    std::string level;      ///< "info", "warn" or "error"
    std::string message;

    nlohmann::json to_json() const {
        return nlohmann::json{{"timestamp", timestamp}, {"level", level}, {"message", message}};
    }
};

/** \brief Point-in-time view of the supervised process. */
struct ServiceInfo {
    ServiceStatus status{ServiceStatus::Stopped};
    std::optional<pid_t> pid;
    uint16_t port{kDefaultServicePort};
    std::optional<int64_t> started_at;   ///< Epoch milliseconds
    int restart_count{0};
    std::string last_error;
    std::optional<int64_t> uptime_ms;    ///< Only while running
    std::vector<LogEntry> logs;

    nlohmann::json to_json() const {
        nlohmann::json log_array = nlohmann::json::array();
        for (const auto& e : logs) log_array.push_back(e.to_json());
        nlohmann::json j{
            {"status", to_string(status)},
            {"pid", pid ? nlohmann::json(*pid) : nlohmann::json(nullptr)},
            {"port", port},
            {"startedAt", started_at ? nlohmann::json(*started_at) : nlohmann::json(nullptr)},
            {"restartCount", restart_count},
            {"uptime", uptime_ms ? nlohmann::json(*uptime_ms) : nlohmann::json(nullptr)},
            {"logs", std::move(log_array)},
        };
        if (!last_error.empty()) j["lastError"] = last_error;
        return j;
    }
};

/** \brief Outcome of `start()`/`restart()`. */
struct StartResult {
    bool success{false};
    pid_t pid{-1};
    uint16_t port{0};
    std::string error;

    nlohmann::json to_json() const {
        if (!success) return nlohmann::json{{"success", false}, {"error", error}};
        return nlohmann::json{{"success", true}, {"pid", pid}, {"port", port}};
    }
};

} // namespace supervisor
