#pragma once

#include "HttpTypes.hpp"

namespace http_client_opts {

/**
 * \brief Register the `http_client` option section.
 *
 * Safe to call multiple times; registration is protected by an internal flag.
 */
void register_options();

http::HttpClientConfig get_client_config();

} // namespace http_client_opts
