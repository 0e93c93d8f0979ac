#pragma once

#include "ServiceConfig.hpp"

namespace supervisor_opts {

/**
 * \brief Register the `supervisor` option section.
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

/** \brief Launch parameters assembled from config file and command line. */
supervisor::ServiceConfig get_service_config();

} // namespace supervisor_opts
