#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#include <signal.h>
#include <sys/wait.h>

#include "logger.hpp"
#include "tests/util/test_support.hpp"
#include "supervisor/InterpreterResolver.hpp"
#include "supervisor/LogBuffer.hpp"
#include "supervisor/ProcessSupervisor.hpp"

using namespace supervisor;
namespace fs = std::filesystem;
using namespace std::chrono_literals;
using hostbus::test::make_logger;
using hostbus::test::TempDir;
using hostbus::test::wait_until;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

SupervisorTimings fast_timings()
{
    SupervisorTimings t;
    t.restart_delay = 30ms;
    t.liveness_interval = 100ms;
    t.stop_grace = 500ms;
    t.restart_settle = 10ms;
    return t;
}

/// Config running `body` as a shell script through /bin/sh.
ServiceConfig shell_service(const TempDir& dir, const std::string& body)
{
    const fs::path script = dir.path() / "main.sh";
    std::ofstream(script) << body << "\n";
    ServiceConfig config;
    config.python_path = "/bin/sh";
    config.service_dir = dir.path();
    config.script_path = "main.sh";
    return config;
}

bool has_log(const ServiceInfo& info, const std::string& needle, const std::string& level = "")
{
    return std::any_of(info.logs.begin(), info.logs.end(), [&](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos && (level.empty() || e.level == level);
    });
}

int count_logs(const ServiceInfo& info, const std::string& needle)
{
    return static_cast<int>(std::count_if(info.logs.begin(), info.logs.end(), [&](const LogEntry& e) {
        return e.message.find(needle) != std::string::npos;
    }));
}

} // namespace

// ─── Lifecycle ──────────────────────────────────────────────────────────────

TEST(ProcessSupervisorTest, StartCapturesOutputThenStops)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "echo \"hello $SERVICE_PORT\"\necho oops 1>&2\nexec sleep 30");
    config.port = 9123;

    auto started = sup.start(config);
    ASSERT_TRUE(started.success) << started.error;
    EXPECT_GT(started.pid, 0);
    EXPECT_EQ(started.port, 9123);

    ASSERT_TRUE(wait_until([&] {
        auto info = sup.get_info();
        return has_log(info, "hello 9123", "info") && has_log(info, "oops", "warn");
    }));
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Running);
    ASSERT_TRUE(info.pid.has_value());
    EXPECT_EQ(*info.pid, started.pid);
    EXPECT_TRUE(info.uptime_ms.has_value());

    EXPECT_TRUE(sup.stop());
    info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_FALSE(info.pid.has_value());
    EXPECT_FALSE(info.uptime_ms.has_value());
    EXPECT_TRUE(info.last_error.empty());
}

TEST(ProcessSupervisorTest, SecondStartIsRejected)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exec sleep 30");
    ASSERT_TRUE(sup.start(config).success);

    auto again = sup.start(config);
    EXPECT_FALSE(again.success);
    EXPECT_EQ(again.error, "Service is already running");
    EXPECT_EQ(again.to_json(), (nlohmann::json{{"success", false}, {"error", "Service is already running"}}));
    sup.stop();
}

TEST(ProcessSupervisorTest, StopWithoutProcessSucceeds)
{
    ProcessSupervisor sup(make_logger(), fast_timings());
    EXPECT_TRUE(sup.stop());
    EXPECT_EQ(sup.get_info().status, ServiceStatus::Stopped);
}

TEST(ProcessSupervisorTest, StopEscalatesToKill)
{
    TempDir dir;
    auto timings = fast_timings();
    timings.stop_grace = 200ms;
    ProcessSupervisor sup(make_logger(), timings);
    auto config = shell_service(dir, "trap '' TERM\necho ready\nwhile true; do sleep 0.05; done");
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "ready"); }));

    sup.stop();
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_TRUE(has_log(info, "sending SIGKILL", "warn"));
}

TEST(ProcessSupervisorTest, RestartSpawnsFreshProcess)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exec sleep 30");
    auto first = sup.start(config);
    ASSERT_TRUE(first.success);

    config.port = 9200;
    auto second = sup.restart(config);
    ASSERT_TRUE(second.success) << second.error;
    EXPECT_NE(second.pid, first.pid);
    EXPECT_EQ(second.port, 9200);
    EXPECT_EQ(sup.get_info().status, ServiceStatus::Running);
    sup.stop();
}

// ─── Exit handling ──────────────────────────────────────────────────────────

TEST(ProcessSupervisorTest, CrashingWorkerStopsAfterRestartBudget)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exit 3");
    config.max_restarts = 2;

    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "Restart budget of 2 exhausted, giving up"); }));

    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_EQ(info.restart_count, 2);
    EXPECT_EQ(info.last_error, "Process exited with code 3");
    EXPECT_EQ(count_logs(info, "Service started"), 3);
}

TEST(ProcessSupervisorTest, CleanExitIsNotRestarted)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    ASSERT_TRUE(sup.start(shell_service(dir, "exit 0")).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "Service exited normally"); }));

    std::this_thread::sleep_for(100ms);
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_EQ(info.restart_count, 0);
    EXPECT_TRUE(info.last_error.empty());
    EXPECT_EQ(count_logs(info, "Service started"), 1);
}

TEST(ProcessSupervisorTest, DeliberateExitCodeIsNotRestarted)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exit 42");
    config.no_restart_exit_codes = {42};
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return sup.get_info().status == ServiceStatus::Stopped; }));

    std::this_thread::sleep_for(100ms);
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_EQ(info.last_error, "Process exited with code 42");
    EXPECT_EQ(info.restart_count, 0);
    EXPECT_EQ(count_logs(info, "Service started"), 1);
}

TEST(ProcessSupervisorTest, AutoRestartDisabledLeavesError)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exit 1");
    config.auto_restart = false;
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return sup.get_info().status == ServiceStatus::Error; }));

    std::this_thread::sleep_for(100ms);
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Error);
    EXPECT_EQ(info.restart_count, 0);
    EXPECT_EQ(info.to_json()["lastError"], "Process exited with code 1");
}

TEST(ProcessSupervisorTest, UnenterableWorkDirFailsSpawn)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "exit 0");
    config.work_dir = dir.path() / "missing" / "dir";

    auto result = sup.start(config);
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("cannot enter working directory"), std::string::npos);
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Error);
    EXPECT_EQ(info.last_error, result.error);
    EXPECT_TRUE(has_log(info, "Failed to start service", "error"));
}

// ─── Environment and logs ───────────────────────────────────────────────────

TEST(ProcessSupervisorTest, LaunchContractOverridesEnvironment)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "echo \"env $HB_TEST_VAR $PYTHONUNBUFFERED $PYTHONIOENCODING $SERVICE_PORT\"");
    config.env = {{"HB_TEST_VAR", "abc"}, {"PYTHONUNBUFFERED", "0"}, {"SERVICE_PORT", "1"}};
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "Service exited normally"); }));
    EXPECT_TRUE(has_log(sup.get_info(), "env abc 1 utf-8 8765"));
}

TEST(ProcessSupervisorTest, ScriptArgumentsArePassed)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "echo \"args $1 $2\"");
    config.args = {"--mode", "fast"};
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "args --mode fast"); }));
}

TEST(ProcessSupervisorTest, InfoKeepsNewestHundredEntries)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    auto config = shell_service(dir, "i=0\nwhile [ $i -lt 150 ]; do echo line$i; i=$((i+1)); done");
    ASSERT_TRUE(sup.start(config).success);
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "Service exited normally"); }));

    auto info = sup.get_info();
    ASSERT_EQ(info.logs.size(), LogBuffer::kDefaultCapacity);
    EXPECT_EQ(info.logs.back().message, "Service exited normally");
    EXPECT_FALSE(has_log(info, "line0"));
    EXPECT_TRUE(has_log(info, "line149"));
}

TEST(ProcessSupervisorTest, ObserversSeeTransitionsAndLogs)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    std::mutex m;
    std::vector<ServiceStatus> statuses;
    std::vector<std::string> lines;
    sup.set_status_callback([&](ServiceStatus s, const std::string&) {
        std::lock_guard<std::mutex> lk(m);
        statuses.push_back(s);
    });
    sup.set_log_callback([&](const LogEntry& e) {
        std::lock_guard<std::mutex> lk(m);
        lines.push_back(e.message);
    });

    ASSERT_TRUE(sup.start(shell_service(dir, "echo up\nexec sleep 30")).success);
    ASSERT_TRUE(wait_until([&] {
        std::lock_guard<std::mutex> lk(m);
        return std::find(lines.begin(), lines.end(), "up") != lines.end();
    }));
    sup.stop();

    std::lock_guard<std::mutex> lk(m);
    EXPECT_EQ(statuses, (std::vector<ServiceStatus>{ServiceStatus::Starting, ServiceStatus::Running,
                                                    ServiceStatus::Stopping, ServiceStatus::Stopped}));
}

TEST(ProcessSupervisorTest, CleanupKillsLiveWorker)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    ASSERT_TRUE(sup.start(shell_service(dir, "exec sleep 30")).success);
    sup.cleanup();
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Stopped);
    EXPECT_TRUE(has_log(info, "Service killed during cleanup"));
    sup.cleanup();
}

// ─── Paths and liveness ─────────────────────────────────────────────────────

namespace {

/// Switches the process working directory for the lifetime of the guard.
class CwdGuard {
public:
    explicit CwdGuard(const fs::path& dir)
        : previous_(fs::current_path())
    {
        fs::current_path(dir);
    }
    ~CwdGuard()
    {
        std::error_code ec;
        fs::current_path(previous_, ec);
    }

private:
    fs::path previous_;
};

} // namespace

TEST(ProcessSupervisorTest, RelativeScriptSurvivesWorkDirChange)
{
    TempDir launch_dir;
    TempDir work_dir;
    fs::create_directories(launch_dir.path() / "rel");
    std::ofstream(launch_dir.path() / "rel" / "worker.sh") << "echo \"relative in $(pwd)\"\nexec sleep 30\n";

    CwdGuard cwd(launch_dir.path());
    ProcessSupervisor sup(make_logger(), fast_timings());
    ServiceConfig config;
    config.python_path = "/bin/sh";
    config.script_path = "rel/worker.sh";
    config.work_dir = work_dir.path();

    auto started = sup.start(config);
    ASSERT_TRUE(started.success) << started.error;
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "relative in "); }));
    auto info = sup.get_info();
    EXPECT_EQ(info.status, ServiceStatus::Running);
    EXPECT_TRUE(has_log(info, "relative in " + fs::canonical(work_dir.path()).string()));
    EXPECT_TRUE(sup.stop());
}

TEST(ProcessSupervisorTest, RelativeInterpreterSurvivesWorkDirChange)
{
    TempDir launch_dir;
    TempDir work_dir;
    fs::create_symlink("/bin/sh", launch_dir.path() / "mysh");
    const fs::path script = launch_dir.path() / "main.sh";
    std::ofstream(script) << "echo interpreter-ok\nexec sleep 30\n";

    CwdGuard cwd(launch_dir.path());
    ProcessSupervisor sup(make_logger(), fast_timings());
    ServiceConfig config;
    config.python_path = "mysh";
    config.script_path = script;
    config.work_dir = work_dir.path();

    auto started = sup.start(config);
    ASSERT_TRUE(started.success) << started.error;
    ASSERT_TRUE(wait_until([&] { return has_log(sup.get_info(), "interpreter-ok"); }));
    EXPECT_TRUE(sup.stop());
}

TEST(ProcessSupervisorTest, ExternallyReapedWorkerIsReportedTerminated)
{
    TempDir dir;
    ProcessSupervisor sup(make_logger(), fast_timings());
    // The background sleep keeps the output pipes open after the shell dies,
    // so the supervisor only learns of the exit through waitpid or kill(pid, 0).
    auto config = shell_service(dir, "sleep 5 &\nwhile :; do sleep 1; done");
    config.auto_restart = false;
    auto started = sup.start(config);
    ASSERT_TRUE(started.success) << started.error;

    std::atomic<pid_t> reaped{0};
    std::thread reaper([&] {
        int ws = 0;
        reaped = ::waitpid(started.pid, &ws, 0);
    });
    std::this_thread::sleep_for(50ms);
    ASSERT_EQ(::kill(started.pid, SIGKILL), 0);
    reaper.join();
    ASSERT_EQ(reaped.load(), started.pid);

    ASSERT_TRUE(wait_until([&] { return sup.get_info().status == ServiceStatus::Error; }));
    auto info = sup.get_info();
    EXPECT_EQ(info.last_error, "Process terminated unexpectedly");
    EXPECT_TRUE(has_log(info, "Process terminated unexpectedly", "error"));
    EXPECT_FALSE(info.pid.has_value());
    EXPECT_EQ(info.restart_count, 0);
}

// ─── LogBuffer ──────────────────────────────────────────────────────────────

TEST(LogBufferTest, EvictsOldestFirst)
{
    LogBuffer buffer(3);
    for (int i = 0; i < 5; ++i) buffer.push(LogEntry{i, "info", "m" + std::to_string(i)});
    auto entries = buffer.snapshot();
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].message, "m2");
    EXPECT_EQ(entries[2].message, "m4");
    buffer.clear();
    EXPECT_EQ(buffer.size(), 0u);
}

TEST(LogBufferTest, ZeroCapacityIsRejected)
{
    EXPECT_THROW(LogBuffer(0), std::invalid_argument);
}

// ─── InterpreterResolver ────────────────────────────────────────────────────

TEST(InterpreterResolverTest, PrefersExistingExplicitPath)
{
    ServiceConfig config;
    config.python_path = "/bin/sh";
    config.venv_path = "/nonexistent/venv";
    EXPECT_EQ(InterpreterResolver::resolve_interpreter(config), fs::path("/bin/sh"));
}

TEST(InterpreterResolverTest, FallsBackToVirtualEnv)
{
    TempDir dir;
    const fs::path venv_python = dir.path() / "venv" / "bin" / "python";
    fs::create_directories(venv_python.parent_path());
    std::ofstream(venv_python) << "";

    ServiceConfig config;
    config.python_path = dir.path() / "no-such-python";
    config.venv_path = dir.path() / "venv";
    EXPECT_EQ(InterpreterResolver::resolve_interpreter(config), venv_python);
}

TEST(InterpreterResolverTest, ResolvesScriptAndWorkDir)
{
    ServiceConfig config;
    config.service_dir = "/srv/agent";
    EXPECT_EQ(InterpreterResolver::resolve_script(config), fs::path("/srv/agent/main.py"));
    config.script_path = "bin/run.py";
    EXPECT_EQ(InterpreterResolver::resolve_script(config), fs::path("/srv/agent/bin/run.py"));
    config.script_path = "/opt/run.py";
    EXPECT_EQ(InterpreterResolver::resolve_script(config), fs::path("/opt/run.py"));

    EXPECT_EQ(InterpreterResolver::resolve_work_dir(config), fs::path("/srv/agent"));
    config.work_dir = "/tmp";
    EXPECT_EQ(InterpreterResolver::resolve_work_dir(config), fs::path("/tmp"));
}

TEST(InterpreterResolverTest, ProvisionsPlaceholderScript)
{
    TempDir dir;
    const fs::path script = dir.path() / "nested" / "main.py";
    std::string error;
    ASSERT_TRUE(InterpreterResolver::provision_placeholder(script, error)) << error;

    std::ifstream in(script);
    std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    EXPECT_EQ(content, InterpreterResolver::placeholder_source());
    EXPECT_NE(content.find("SERVICE_PORT"), std::string::npos);
}
