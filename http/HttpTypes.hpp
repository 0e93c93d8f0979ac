/**
 * \defgroup http_module Resilient HTTP Client
 * \brief Request/response calls to the worker's data-plane API.
 * @{
 */
#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

namespace http {

enum class HttpMethod { Get, Post, Put, Delete };

inline const char* to_string(HttpMethod method) {
    switch (method) {
        case HttpMethod::Get:    return "GET";
        case HttpMethod::Post:   return "POST";
        case HttpMethod::Put:    return "PUT";
        case HttpMethod::Delete: return "DELETE";
    }
    return "GET";
}

/** \brief One outgoing request, already resolved to a host and port. */
struct HttpRequest {
    HttpMethod method{HttpMethod::Get};
    std::string host;
    int port{80};
    std::string target{"/"};  ///< Path plus query
    std::vector<std::pair<std::string, std::string>> headers;
    std::string body;
};

struct HttpResponse {
    int status{0};
    std::string reason;
    std::map<std::string, std::string> headers;  ///< Names lower-cased
    std::string body;

    bool is_success() const { return status >= 200 && status < 300; }
};

/** \brief Outcome of one API call: the service's `{success, data?, error?, message?}` shape. */
struct ApiResult {
    bool success{false};
    nlohmann::json data;  ///< null when absent
    std::optional<std::string> error;
    std::optional<std::string> message;

    static ApiResult failure(std::string error) {
        ApiResult r;
        r.error = std::move(error);
        return r;
    }

    nlohmann::json to_json() const {
        nlohmann::json j{{"success", success}};
        if (!data.is_null()) j["data"] = data;
        if (error) j["error"] = *error;
        if (message) j["message"] = *message;
        return j;
    }
};

/** \brief Per-call overrides of the client defaults. */
struct RequestOptions {
    std::optional<std::chrono::milliseconds> timeout;
    std::optional<int> retries;  ///< Total attempts
    std::vector<std::pair<std::string, std::string>> headers;
};

/** \brief Client defaults. */
struct HttpClientConfig {
    std::string host{"127.0.0.1"};
    int port{8766};
    std::chrono::milliseconds timeout{5000};
    int retries{3};
    std::chrono::milliseconds retry_delay{500};
};

} // namespace http

/// @}
