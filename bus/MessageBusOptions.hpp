#pragma once

#include "BusConfig.hpp"

namespace message_bus_opts {

/**
 * \brief Register the `message_bus` option section.
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

/** \brief Bus parameters assembled from config file and command line. */
bus::BusConfig get_bus_config();

} // namespace message_bus_opts
