#include "ProcessSupervisor.hpp"
#include "InterpreterResolver.hpp"
#include "processUtils.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace supervisor {

namespace {

/// Upper bound on one monitor poll; deadlines are checked at this granularity.
constexpr int kMonitorSliceMs = 20;
constexpr auto kKillWait = std::chrono::seconds(2);

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

/// Written by the child to the exec-status pipe when it cannot exec.
struct ExecFailure {
    int stage;  ///< 1 = chdir, 2 = execve
    int err;
};

void set_nonblocking(int fd) {
    int flags = ::fcntl(fd, F_GETFL, 0);
    if (flags >= 0) ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

void close_pair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

} // namespace

ProcessSupervisor::ProcessSupervisor(std::shared_ptr<Logger> logger, SupervisorTimings timings)
    : logger_(std::move(logger)), timings_(timings)
{
    if (!logger_) {
        throw std::invalid_argument("ProcessSupervisor requires a logger");
    }
}

ProcessSupervisor::~ProcessSupervisor() {
    {
        std::lock_guard<std::mutex> lk(dispatch_mutex_);
        status_cb_ = nullptr;
        log_cb_ = nullptr;
    }
    cleanup();
}

void ProcessSupervisor::set_status_callback(StatusCallback cb) {
    std::lock_guard<std::mutex> lk(dispatch_mutex_);
    status_cb_ = std::move(cb);
}

void ProcessSupervisor::set_log_callback(LogCallback cb) {
    std::lock_guard<std::mutex> lk(dispatch_mutex_);
    log_cb_ = std::move(cb);
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

StartResult ProcessSupervisor::start(const ServiceConfig& config) {
    StartResult result;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (status_ == ServiceStatus::Running || status_ == ServiceStatus::Starting) {
            result.error = "Service is already running";
            logger_->warning("[supervisor] start rejected: already running (pid " +
                             std::to_string(child_ ? child_->pid : -1) + ")");
            return result;
        }
        if (status_ == ServiceStatus::Stopping) {
            result.error = "Service is stopping";
            return result;
        }
        config_ = config;
        restart_count_ = 0;
        restart_at_.reset();
        last_error_.clear();
        result = spawn_locked();
        if (result.success) {
            ensure_monitor_locked();
        }
    }
    dispatch_events();
    return result;
}

bool ProcessSupervisor::stop() {
    {
        std::unique_lock<std::mutex> lk(mutex_);
        restart_at_.reset();
        if (!child_) {
            if (status_ != ServiceStatus::Stopped) {
                set_status_locked(ServiceStatus::Stopped);
            }
        } else {
            const pid_t pid = child_->pid;
            add_log_locked("info", "Stopping service (pid " + std::to_string(pid) + ")");
            set_status_locked(ServiceStatus::Stopping);
            ::kill(pid, SIGTERM);

            auto gone = [this, pid] { return !child_ || child_->pid != pid; };
            if (!exit_cv_.wait_for(lk, timings_.stop_grace, gone)) {
                add_log_locked("warn", "Service did not exit within " +
                               std::to_string(timings_.stop_grace.count()) + " ms, sending SIGKILL");
                ::kill(pid, SIGKILL);
                if (!exit_cv_.wait_for(lk, kKillWait, gone)) {
                    add_log_locked("error", "Service (pid " + std::to_string(pid) + ") did not exit after SIGKILL");
                }
            }
        }
    }
    dispatch_events();
    return true;
}

StartResult ProcessSupervisor::restart(const std::optional<ServiceConfig>& config) {
    stop();
    std::this_thread::sleep_for(timings_.restart_settle);
    ServiceConfig next;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        next = config ? *config : config_;
    }
    return start(next);
}

ServiceInfo ProcessSupervisor::get_info() const {
    std::lock_guard<std::mutex> lk(mutex_);
    ServiceInfo info;
    info.status = status_;
    if (child_) info.pid = child_->pid;
    info.port = config_.port;
    info.started_at = started_at_;
    info.restart_count = restart_count_;
    info.last_error = last_error_;
    if (status_ == ServiceStatus::Running && started_at_) {
        info.uptime_ms = now_ms() - *started_at_;
    }
    info.logs = logs_.snapshot();
    return info;
}

void ProcessSupervisor::cleanup() {
    std::thread monitor;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        restart_at_.reset();
        monitor_stop_ = true;
        monitor.swap(monitor_);
    }
    if (monitor.joinable()) {
        monitor.join();
    }
    {
        std::lock_guard<std::mutex> lk(mutex_);
        if (child_) {
            const pid_t pid = child_->pid;
            ::kill(pid, SIGKILL);
            int ws = 0;
            while (::waitpid(pid, &ws, 0) < 0 && errno == EINTR) {
            }
            close_child_fds_locked();
            child_.reset();
            started_at_.reset();
            liveness_at_.reset();
            add_log_locked("info", "Service killed during cleanup (pid " + std::to_string(pid) + ")");
            set_status_locked(ServiceStatus::Stopped);
            exit_cv_.notify_all();
        }
    }
    dispatch_events();
}

// ---------------------------------------------------------------------------
// Spawning
// ---------------------------------------------------------------------------

StartResult ProcessSupervisor::spawn_locked() {
    set_status_locked(ServiceStatus::Starting);

    auto fail = [this](const std::string& message) {
        last_error_ = message;
        add_log_locked("error", "Failed to start service: " + message);
        set_status_locked(ServiceStatus::Error);
        StartResult r;
        r.error = message;
        return r;
    };

    // The child changes into work_dir before execve; relative paths must not
    // depend on that.
    std::error_code ec;
    fs::path interpreter = InterpreterResolver::resolve_interpreter(config_);
    if (interpreter.is_relative() && (interpreter.has_parent_path() || fs::exists(interpreter, ec))) {
        auto resolved = fs::absolute(interpreter, ec);
        if (ec) return fail("cannot resolve interpreter " + interpreter.string() + ": " + ec.message());
        interpreter = std::move(resolved);
    }
    const fs::path script = fs::absolute(InterpreterResolver::resolve_script(config_), ec);
    if (ec) return fail("cannot resolve script path: " + ec.message());
    const fs::path work_dir = fs::absolute(InterpreterResolver::resolve_work_dir(config_), ec);
    if (ec) return fail("cannot resolve working directory: " + ec.message());

    if (!fs::exists(script, ec)) {
        std::string why;
        if (!InterpreterResolver::provision_placeholder(script, why)) {
            return fail("script " + script.string() + " not found and no placeholder could be created: " + why);
        }
        add_log_locked("info", "Created placeholder script " + script.string());
    }

    // Process env, then caller overrides, then the forced launch contract.
    auto env = ProcessUtils::current_environment();
    for (const auto& [k, v] : config_.env) env[k] = v;
    env["PYTHONUNBUFFERED"] = "1";
    env["PYTHONIOENCODING"] = "utf-8";
    env["SERVICE_PORT"] = std::to_string(config_.port);

    std::vector<std::string> env_strings;
    env_strings.reserve(env.size());
    for (const auto& [k, v] : env) env_strings.push_back(k + "=" + v);
    std::vector<char*> envp;
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<std::string> arg_strings{interpreter.string(), script.string()};
    arg_strings.insert(arg_strings.end(), config_.args.begin(), config_.args.end());
    std::vector<char*> argv;
    for (auto& s : arg_strings) argv.push_back(s.data());
    argv.push_back(nullptr);

    const std::string work_dir_str = work_dir.string();

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(out_pipe, O_CLOEXEC) != 0 || ::pipe2(err_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        const int e = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return fail(std::string("cannot create pipes: ") + std::strerror(e));
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
        const int e = errno;
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return fail(std::string("fork failed: ") + std::strerror(e));
    }

    if (pid == 0) {
        // Child: async-signal-safe calls only.
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ExecFailure failure{1, 0};
        if (::chdir(work_dir_str.c_str()) != 0) {
            failure.err = errno;
            if (::write(exec_pipe[1], &failure, sizeof(failure)) < 0) {
            }
            ::_exit(127);
        }
        ::execve(argv[0], argv.data(), envp.data());
        failure.stage = 2;
        failure.err = errno;
        if (::write(exec_pipe[1], &failure, sizeof(failure)) < 0) {
        }
        ::_exit(127);
    }

    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    // The exec pipe closes on a successful execve (CLOEXEC) and carries an
    // ExecFailure otherwise.
    ExecFailure failure{0, 0};
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &failure, sizeof(failure));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(failure))) {
        int ws = 0;
        while (::waitpid(pid, &ws, 0) < 0 && errno == EINTR) {
        }
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        if (failure.stage == 1) {
            return fail("cannot enter working directory " + work_dir_str + ": " + std::strerror(failure.err));
        }
        return fail("cannot execute " + interpreter.string() + ": " + std::strerror(failure.err));
    }

    set_nonblocking(out_pipe[0]);
    set_nonblocking(err_pipe[0]);

    Child child;
    child.pid = pid;
    child.out_fd = out_pipe[0];
    child.err_fd = err_pipe[0];
    child_ = std::move(child);
    started_at_ = now_ms();
    liveness_at_ = Clock::now() + timings_.liveness_interval;

    add_log_locked("info", "Service started (pid " + std::to_string(pid) + ", port " +
                   std::to_string(config_.port) + ", interpreter " + interpreter.string() + ")");
    set_status_locked(ServiceStatus::Running);

    StartResult r;
    r.success = true;
    r.pid = pid;
    r.port = config_.port;
    return r;
}

// ---------------------------------------------------------------------------
// State helpers (mutex_ held)
// ---------------------------------------------------------------------------

void ProcessSupervisor::set_status_locked(ServiceStatus status) {
    if (status_ == status) return;
    logger_->debug(std::string("[supervisor] status ") + to_string(status_) + " -> " + to_string(status));
    status_ = status;
    Event e;
    e.is_status = true;
    e.status = status;
    e.last_error = last_error_;
    events_.push_back(std::move(e));
}

void ProcessSupervisor::add_log_locked(const std::string& level, const std::string& message) {
    LogEntry entry{now_ms(), level, message};
    if (level == "error") {
        logger_->error("[supervisor] " + message);
    } else if (level == "warn") {
        logger_->warning("[supervisor] " + message);
    } else {
        logger_->info("[supervisor] " + message);
    }
    logs_.push(entry);
    Event e;
    e.entry = std::move(entry);
    events_.push_back(std::move(e));
}

void ProcessSupervisor::emit_lines_locked(std::string& partial, const char* data, size_t n, bool is_stderr) {
    partial.append(data, n);
    size_t pos = 0;
    while ((pos = partial.find('\n')) != std::string::npos) {
        std::string line = partial.substr(0, pos);
        partial.erase(0, pos + 1);
        flush_partial_locked(line, is_stderr);
    }
}

void ProcessSupervisor::flush_partial_locked(std::string& partial, bool is_stderr) {
    while (!partial.empty() && (partial.back() == '\r' || partial.back() == ' ' || partial.back() == '\t')) {
        partial.pop_back();
    }
    if (partial.empty()) return;

    LogEntry entry{now_ms(), is_stderr ? "warn" : "info", partial};
    if (is_stderr) {
        logger_->warning("[worker] " + partial);
    } else {
        logger_->info("[worker] " + partial);
    }
    logs_.push(entry);
    Event e;
    e.entry = std::move(entry);
    events_.push_back(std::move(e));
    partial.clear();
}

void ProcessSupervisor::drain_fd_locked(int& fd, std::string& partial, bool is_stderr) {
    if (fd < 0) return;
    char buf[4096];
    for (;;) {
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n > 0) {
            emit_lines_locked(partial, buf, static_cast<size_t>(n), is_stderr);
            continue;
        }
        if (n < 0 && errno == EINTR) continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) return;
        // EOF or a hard error: the stream is finished.
        flush_partial_locked(partial, is_stderr);
        ::close(fd);
        fd = -1;
        return;
    }
}

void ProcessSupervisor::close_child_fds_locked() {
    if (!child_) return;
    drain_fd_locked(child_->out_fd, child_->out_partial, false);
    drain_fd_locked(child_->err_fd, child_->err_partial, true);
    flush_partial_locked(child_->out_partial, false);
    flush_partial_locked(child_->err_partial, true);
    if (child_->out_fd >= 0) { ::close(child_->out_fd); child_->out_fd = -1; }
    if (child_->err_fd >= 0) { ::close(child_->err_fd); child_->err_fd = -1; }
}

bool ProcessSupervisor::reap_locked() {
    if (!child_) return false;
    int ws = 0;
    const pid_t r = ::waitpid(child_->pid, &ws, WNOHANG);
    if (r == 0) return false;
    if (r < 0) {
        if (errno == EINTR) return false;
        // ECHILD: someone else reaped it; the exit status is unknown.
        close_child_fds_locked();
        child_.reset();
        started_at_.reset();
        liveness_at_.reset();
        last_error_ = "Process terminated unexpectedly";
        add_log_locked("error", last_error_);
        set_status_locked(ServiceStatus::Error);
        exit_cv_.notify_all();
        return true;
    }
    close_child_fds_locked();
    child_.reset();
    handle_exit_locked(ws);
    exit_cv_.notify_all();
    return true;
}

void ProcessSupervisor::handle_exit_locked(int wait_status) {
    int code = -1;
    int sig = 0;
    if (WIFEXITED(wait_status)) {
        code = WEXITSTATUS(wait_status);
    } else if (WIFSIGNALED(wait_status)) {
        sig = WTERMSIG(wait_status);
    }
    const std::string how = sig != 0 ? "signal " + std::to_string(sig) : "code " + std::to_string(code);
    started_at_.reset();
    liveness_at_.reset();

    if (status_ == ServiceStatus::Stopping) {
        add_log_locked("info", "Service exited (" + how + ")");
        set_status_locked(ServiceStatus::Stopped);
        return;
    }
    if (sig == 0 && code == 0) {
        add_log_locked("info", "Service exited normally");
        set_status_locked(ServiceStatus::Stopped);
        return;
    }
    const auto& deliberate = config_.no_restart_exit_codes;
    if (sig == 0 && std::find(deliberate.begin(), deliberate.end(), code) != deliberate.end()) {
        last_error_ = "Process exited with code " + std::to_string(code);
        add_log_locked("info", last_error_ + ", not restarting");
        set_status_locked(ServiceStatus::Stopped);
        return;
    }

    last_error_ = sig != 0 ? "Process terminated by signal " + std::to_string(sig)
                           : "Process exited with code " + std::to_string(code);
    add_log_locked("error", last_error_);
    set_status_locked(ServiceStatus::Error);

    if (!config_.auto_restart) return;
    if (restart_count_ < config_.max_restarts) {
        ++restart_count_;
        restart_at_ = Clock::now() + timings_.restart_delay;
        add_log_locked("info", "Restarting in " + std::to_string(timings_.restart_delay.count()) +
                       " ms (attempt " + std::to_string(restart_count_) + "/" +
                       std::to_string(config_.max_restarts) + ")");
    } else {
        add_log_locked("error", "Restart budget of " + std::to_string(config_.max_restarts) +
                       " exhausted, giving up");
        set_status_locked(ServiceStatus::Stopped);
    }
}

// ---------------------------------------------------------------------------
// Monitor thread
// ---------------------------------------------------------------------------

void ProcessSupervisor::ensure_monitor_locked() {
    if (monitor_.joinable()) return;
    monitor_stop_ = false;
    monitor_ = std::thread(&ProcessSupervisor::monitor_loop, this);
}

void ProcessSupervisor::monitor_loop() {
    ProcessUtils::set_current_thread_name("hb-supervisor");
    for (;;) {
        std::vector<pollfd> fds;
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (monitor_stop_) break;
            if (child_) {
                if (child_->out_fd >= 0) fds.push_back(pollfd{child_->out_fd, POLLIN, 0});
                if (child_->err_fd >= 0) fds.push_back(pollfd{child_->err_fd, POLLIN, 0});
            }
        }

        if (::poll(fds.data(), fds.size(), kMonitorSliceMs) < 0 && errno != EINTR) {
            logger_->warning(std::string("[supervisor] poll failed: ") + std::strerror(errno));
            std::this_thread::sleep_for(std::chrono::milliseconds(kMonitorSliceMs));
        }

        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (monitor_stop_) break;
            if (child_) {
                drain_fd_locked(child_->out_fd, child_->out_partial, false);
                drain_fd_locked(child_->err_fd, child_->err_partial, true);
            }
            reap_locked();

            const auto now = Clock::now();
            if (status_ == ServiceStatus::Running && child_ && liveness_at_ && now >= *liveness_at_) {
                if (::kill(child_->pid, 0) != 0 && errno == ESRCH) {
                    close_child_fds_locked();
                    child_.reset();
                    started_at_.reset();
                    liveness_at_.reset();
                    last_error_ = "Process terminated unexpectedly";
                    add_log_locked("error", last_error_);
                    set_status_locked(ServiceStatus::Error);
                    exit_cv_.notify_all();
                } else {
                    liveness_at_ = now + timings_.liveness_interval;
                }
            }

            if (restart_at_ && now >= *restart_at_) {
                restart_at_.reset();
                if (status_ == ServiceStatus::Error && !child_) {
                    add_log_locked("info", "Restarting service (attempt " + std::to_string(restart_count_) +
                                   "/" + std::to_string(config_.max_restarts) + ")");
                    spawn_locked();
                }
            }
        }
        dispatch_events();
    }
}

void ProcessSupervisor::dispatch_events() {
    std::lock_guard<std::mutex> dl(dispatch_mutex_);
    std::vector<Event> events;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        events.swap(events_);
    }
    for (const auto& e : events) {
        try {
            if (e.is_status) {
                if (status_cb_) status_cb_(e.status, e.last_error);
            } else if (log_cb_) {
                log_cb_(e.entry);
            }
        } catch (const std::exception& ex) {
            logger_->warning(std::string("[supervisor] observer threw: ") + ex.what());
        }
    }
}

} // namespace supervisor
