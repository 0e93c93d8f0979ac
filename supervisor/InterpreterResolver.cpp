#include "InterpreterResolver.hpp"
#include "processUtils.hpp"

#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace supervisor {

namespace {

constexpr const char* kPlaceholderSource =
    "import os\n"
    "import sys\n"
    "import time\n"
    "\n"
    "port = os.environ.get('SERVICE_PORT', '8765')\n"
    "print(f'Placeholder service started on port {port}', flush=True)\n"
    "\n"
    "while True:\n"
    "    time.sleep(10)\n"
    "    print('Service heartbeat', flush=True)\n";

bool exists_quiet(const fs::path& p) {
    std::error_code ec;
    return !p.empty() && fs::exists(p, ec);
}

} // namespace

fs::path InterpreterResolver::resolve_interpreter(const ServiceConfig& config) {
    if (exists_quiet(config.python_path)) {
        return config.python_path;
    }
    if (!config.venv_path.empty()) {
        const fs::path venv_python = config.venv_path / "bin" / "python";
        if (exists_quiet(venv_python)) return venv_python;
    }
    for (const char* name : {"python3", "python"}) {
        if (auto found = ProcessUtils::find_in_path(name)) return *found;
    }
    return fs::path("python3");
}

fs::path InterpreterResolver::resolve_script(const ServiceConfig& config) {
    if (config.script_path.empty()) {
        return config.service_dir / "main.py";
    }
    if (config.script_path.is_relative() && !config.service_dir.empty()) {
        return config.service_dir / config.script_path;
    }
    return config.script_path;
}

fs::path InterpreterResolver::resolve_work_dir(const ServiceConfig& config) {
    if (!config.work_dir.empty()) return config.work_dir;
    if (!config.service_dir.empty()) return config.service_dir;
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path(".") : cwd;
}

bool InterpreterResolver::provision_placeholder(const fs::path& script, std::string& error) {
    std::error_code ec;
    if (script.has_parent_path()) {
        fs::create_directories(script.parent_path(), ec);
        if (ec) {
            error = "cannot create " + script.parent_path().string() + ": " + ec.message();
            return false;
        }
    }
    std::ofstream out(script, std::ios::trunc);
    if (!out) {
        error = "cannot write " + script.string();
        return false;
    }
    out << kPlaceholderSource;
    out.close();
    if (!out) {
        error = "failed writing " + script.string();
        return false;
    }
    return true;
}

const char* InterpreterResolver::placeholder_source() {
    return kPlaceholderSource;
}

} // namespace supervisor
