/**
 * \file supervisor/InterpreterResolver.hpp
 * \brief Chooses the interpreter and entry script used to launch the worker.
 * \ingroup supervisor_module
 */
#pragma once

#include "ServiceConfig.hpp"

#include <filesystem>
#include <string>

namespace supervisor {

class InterpreterResolver {
public:
    /**
     * \brief Pick the interpreter.
     * \details Order: explicit `python_path` if it exists, `<venv>/bin/python`,
     * `python3` then `python` on `PATH`, and finally the bare name `python3`
     * (which then fails at spawn time with a readable error).
     */
    static std::filesystem::path resolve_interpreter(const ServiceConfig& config);

    /** \brief Absolute or service-dir-relative script path, defaulting to `main.py`. */
    static std::filesystem::path resolve_script(const ServiceConfig& config);

    /** \brief Working directory: `work_dir`, else `service_dir`, else the current directory. */
    static std::filesystem::path resolve_work_dir(const ServiceConfig& config);

    /**
     * \brief Write the placeholder worker to `script`, creating parent directories.
     * \return false with `error` set when the file cannot be written.
     */
    static bool provision_placeholder(const std::filesystem::path& script, std::string& error);

    /// Source text of the placeholder worker.
    static const char* placeholder_source();
};

} // namespace supervisor
