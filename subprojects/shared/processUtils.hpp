#pragma once
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <sstream>
#include <string>
#include <thread>

#include <sys/syscall.h>
#include <unistd.h>

/**
 * \file processUtils.hpp
 * \brief Small POSIX helpers for threads, executable lookup and the process environment.
 */

class ProcessUtils {
public:
    static std::filesystem::path get_executable_path();
    static std::filesystem::path get_executable_dir();

    /// Native thread id as shown by debuggers and `top -H`.
    static uint64_t get_native_thread_id() {
        return static_cast<uint64_t>(syscall(SYS_gettid));
    }

    static std::string get_thread_info() {
        std::ostringstream oss;
        oss << "Native ID: " << get_native_thread_id()
            << ", std::thread ID: " << std::this_thread::get_id();
        return oss.str();
    }

    /// Best-effort; Linux truncates names to 15 characters.
    static void set_current_thread_name(const std::string& name);

    /// Search each `PATH` entry for an executable regular file named `name`.
    static std::optional<std::filesystem::path> find_in_path(const std::string& name);

    /// Snapshot of the calling process environment.
    static std::map<std::string, std::string> current_environment();

    /// True if `path` names an existing file with an execute bit for this user.
    static bool is_executable(const std::filesystem::path& path);
};
