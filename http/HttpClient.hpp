/**
 * \file http/HttpClient.hpp
 * \brief Retrying JSON client for the worker's data-plane API.
 * \ingroup http_module
 */
#pragma once

#include "HttpTypes.hpp"
#include "IHttpTransport.hpp"
#include "logger.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace http {

/**
 * \brief Issues `{success, data?, error?}` calls with bounded retries.
 *
 * Transport errors, timeouts and non-JSON bodies are retried up to the configured
 * number of total attempts, sleeping `attempt * retry_delay` in between. A JSON body
 * ends the loop whatever its status. No call throws; failures come back as
 * `ApiResult{success:false, error}`.
 */
class HttpClient {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    /**
     * \param transport Defaults to `TcpHttpTransport`.
     * \throws std::invalid_argument when the logger is null.
     */
    HttpClient(HttpClientConfig config, std::shared_ptr<Logger> logger,
               std::shared_ptr<IHttpTransport> transport = nullptr);

    ApiResult get(const std::string& path, const RequestOptions& options = {});
    ApiResult post(const std::string& path, const nlohmann::json& body = nullptr, const RequestOptions& options = {});
    ApiResult put(const std::string& path, const nlohmann::json& body = nullptr, const RequestOptions& options = {});
    ApiResult del(const std::string& path, const RequestOptions& options = {});

    ApiResult request(HttpMethod method, const std::string& path, const nlohmann::json& body,
                      const RequestOptions& options);

    /** \brief One 2 s attempt against `/health`; true only for `data.status == "healthy"`. */
    bool check_health();

    /** \brief Poll `check_health()` every `interval` until it passes or `max_wait` elapses. */
    bool wait_for_ready(std::chrono::milliseconds max_wait = std::chrono::milliseconds(30000),
                        std::chrono::milliseconds interval = std::chrono::milliseconds(500));

    std::string base_url() const;
    const HttpClientConfig& config() const { return config_; }

    /** \brief Replace the back-off sleep; tests use it to observe delays. */
    void set_sleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    /** \brief Split `path` into host, port and target; absolute `http://` URLs override the base. */
    bool resolve(const std::string& path, HttpRequest& request, std::string& error) const;
    /** \brief Interpret a JSON body; nullopt when the body is not JSON. */
    static std::optional<ApiResult> interpret(const HttpResponse& response);

    HttpClientConfig config_;
    std::shared_ptr<Logger> logger_;
    std::shared_ptr<IHttpTransport> transport_;
    Sleeper sleeper_;
};

} // namespace http
