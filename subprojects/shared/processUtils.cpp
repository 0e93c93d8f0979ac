#include "processUtils.hpp"

#include <pthread.h>
#include <climits>
#include <cstdlib>
#include <cstring>
#include <vector>

extern char** environ;

std::filesystem::path ProcessUtils::get_executable_path() {
    char buffer[PATH_MAX];
    ssize_t len = ::readlink("/proc/self/exe", buffer, sizeof(buffer) - 1);
    if (len <= 0) return {};
    buffer[len] = '\0';
    return std::filesystem::path(buffer);
}

std::filesystem::path ProcessUtils::get_executable_dir() {
    return get_executable_path().parent_path();
}

void ProcessUtils::set_current_thread_name(const std::string& name) {
    // 16 bytes including the terminator
    std::string truncated = name.substr(0, 15);
    pthread_setname_np(pthread_self(), truncated.c_str());
}

bool ProcessUtils::is_executable(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) return false;
    return ::access(path.c_str(), X_OK) == 0;
}

std::optional<std::filesystem::path> ProcessUtils::find_in_path(const std::string& name) {
    const char* raw = std::getenv("PATH");
    if (!raw || !*raw) return std::nullopt;
    std::string path_var(raw);
    size_t start = 0;
    while (start <= path_var.size()) {
        size_t end = path_var.find(':', start);
        if (end == std::string::npos) end = path_var.size();
        std::string dir = path_var.substr(start, end - start);
        if (dir.empty()) dir = ".";
        auto candidate = std::filesystem::path(dir) / name;
        if (is_executable(candidate)) return candidate;
        start = end + 1;
    }
    return std::nullopt;
}

std::map<std::string, std::string> ProcessUtils::current_environment() {
    std::map<std::string, std::string> env;
    for (char** e = environ; e && *e; ++e) {
        const char* eq = std::strchr(*e, '=');
        if (!eq) continue;
        env.emplace(std::string(*e, static_cast<std::size_t>(eq - *e)), std::string(eq + 1));
    }
    return env;
}
