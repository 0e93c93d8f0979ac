/**
 * \file supervisor/ProcessSupervisor.hpp
 * \brief Spawns, monitors, restarts and stops the worker process.
 * \defgroup supervisor_module Process Supervisor
 * \details State machine: stopped -> starting -> running -> stopping -> stopped, with
 * running -> error on an abnormal exit or a spawn failure. An unexpected exit schedules
 * an automatic restart while the restart budget lasts.
 *
 * A single monitor thread owned by the supervisor multiplexes the child's stdout and
 * stderr pipes, reaps it with `waitpid(WNOHANG)` and fires the restart and liveness
 * deadlines. Public operations and the monitor share one mutex.
 */
#pragma once

#include "LogBuffer.hpp"
#include "ServiceConfig.hpp"
#include "logger.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace supervisor {

/**
 * \brief Owner of the worker subprocess.
 * \ingroup supervisor_module
 */
class ProcessSupervisor {
public:
    using Clock = std::chrono::steady_clock;
    /// Fired after every status transition with the status and the current last error.
    using StatusCallback = std::function<void(ServiceStatus, const std::string&)>;
    /// Fired for every captured log entry.
    using LogCallback = std::function<void(const LogEntry&)>;

    explicit ProcessSupervisor(std::shared_ptr<Logger> logger, SupervisorTimings timings = {});
    ~ProcessSupervisor();

    ProcessSupervisor(const ProcessSupervisor&) = delete;
    ProcessSupervisor& operator=(const ProcessSupervisor&) = delete;

    /**
     * \brief Launch the worker.
     * \return pid and port, or a failure while starting/running or when the spawn fails.
     * \details Resets the restart counter. A spawn failure leaves the status `error`
     * and is not retried.
     */
    StartResult start(const ServiceConfig& config);

    /**
     * \brief SIGTERM, then SIGKILL after the grace window.
     * \details Cancels a pending automatic restart. Returns once the exit is observed
     * or the grace windows elapse. Always succeeds, also when nothing runs.
     */
    bool stop();

    /** \brief `stop()`, settle delay, then `start()` with `config` or the previous one. */
    StartResult restart(const std::optional<ServiceConfig>& config = std::nullopt);

    /** \brief Snapshot of the current state including the log ring. */
    ServiceInfo get_info() const;

    /** \brief Kill any live child immediately and stop the monitor thread. Idempotent. */
    void cleanup();

    /**
     * \brief Observers. Callbacks run outside the state lock, serialized, and must not
     * call `start`, `stop`, `restart` or `cleanup`.
     */
    void set_status_callback(StatusCallback cb);
    void set_log_callback(LogCallback cb);

    const SupervisorTimings& timings() const { return timings_; }

private:
    struct Child {
        pid_t pid{-1};
        int out_fd{-1};
        int err_fd{-1};
        std::string out_partial;
        std::string err_partial;
    };

    struct Event {
        bool is_status{false};
        ServiceStatus status{ServiceStatus::Stopped};
        std::string last_error;
        LogEntry entry;
    };

    StartResult spawn_locked();
    void set_status_locked(ServiceStatus status);
    void add_log_locked(const std::string& level, const std::string& message);
    void emit_lines_locked(std::string& partial, const char* data, size_t n, bool is_stderr);
    void flush_partial_locked(std::string& partial, bool is_stderr);
    void drain_fd_locked(int& fd, std::string& partial, bool is_stderr);
    void close_child_fds_locked();
    bool reap_locked();
    void handle_exit_locked(int wait_status);
    void ensure_monitor_locked();
    void monitor_loop();
    void dispatch_events();

    std::shared_ptr<Logger> logger_;
    SupervisorTimings timings_;

    mutable std::mutex mutex_;
    std::condition_variable exit_cv_;
    ServiceConfig config_;
    ServiceStatus status_{ServiceStatus::Stopped};
    std::optional<Child> child_;
    std::optional<int64_t> started_at_;
    int restart_count_{0};
    std::string last_error_;
    LogBuffer logs_;
    std::optional<Clock::time_point> restart_at_;
    std::optional<Clock::time_point> liveness_at_;

    std::thread monitor_;
    bool monitor_stop_{false};

    std::vector<Event> events_;              ///< Guarded by mutex_
    std::mutex dispatch_mutex_;
    StatusCallback status_cb_;               ///< Guarded by dispatch_mutex_
    LogCallback log_cb_;                     ///< Guarded by dispatch_mutex_
};

} // namespace supervisor
