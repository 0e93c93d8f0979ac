#pragma once

#include <chrono>
#include <string>

namespace host_opts {

/** \brief Top-level behaviour of the `hostbus` executable. */
struct HostSettings {
    std::string log_level{"info"};
    bool auto_start_service{true};
    /// 0 skips waiting for the data service after the worker started.
    std::chrono::milliseconds wait_ready{30000};
};

/**
 * \brief Register the `host` option section.
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

HostSettings get_settings();

} // namespace host_opts
