// HttpClientOptions.cpp - data-plane API client options provider with auto-registration
#include "HttpClientOptions.hpp"
#include "options/Options.hpp"

#include <atomic>
#include <mutex>
#include <string>

namespace {
    std::mutex g_http_opts_mtx;
    std::string g_api_host = "127.0.0.1";
    int g_api_port = 8766;
    int g_api_timeout_ms = 5000;
    int g_api_retries = 3;
    int g_api_retry_delay_ms = 500;
    std::atomic<bool> g_http_registered{false};
}

namespace http_client_opts {

void register_options() {
    bool expected = false;
    if (!g_http_registered.compare_exchange_strong(expected, true)) {
        return; // already registered
    }
    shared_opts::Options::add_provider([](CLI::App& app, const nlohmann::json& j) {
        using shared_opts::json_value;
        {
            std::lock_guard<std::mutex> lk(g_http_opts_mtx);
            g_api_host = json_value<std::string>(j, "http_client", "host").value_or("127.0.0.1");
            g_api_port = json_value<int>(j, "http_client", "port").value_or(8766);
            g_api_timeout_ms = json_value<int>(j, "http_client", "timeout_ms").value_or(5000);
            g_api_retries = json_value<int>(j, "http_client", "retries").value_or(3);
            g_api_retry_delay_ms = json_value<int>(j, "http_client", "retry_delay_ms").value_or(500);
        }

        app.add_option("--api-host", g_api_host, "Host of the worker HTTP API")
            ->group("HTTP client");
        app.add_option("--api-port", g_api_port, "Port of the worker HTTP API (default 8766)")
            ->check(CLI::Range(1, 65535))
            ->group("HTTP client");
        app.add_option("--api-timeout-ms", g_api_timeout_ms, "Timeout of a single request attempt")
            ->check(CLI::PositiveNumber)
            ->group("HTTP client");
        app.add_option("--api-retries", g_api_retries, "Total attempts per request")
            ->check(CLI::Range(1, 100))
            ->group("HTTP client");
        app.add_option("--api-retry-delay-ms", g_api_retry_delay_ms, "Base back-off; attempt N waits N times this")
            ->check(CLI::NonNegativeNumber)
            ->group("HTTP client");
    });
}

http::HttpClientConfig get_client_config() {
    std::lock_guard<std::mutex> lk(g_http_opts_mtx);
    http::HttpClientConfig cfg;
    cfg.host = g_api_host;
    cfg.port = g_api_port;
    cfg.timeout = std::chrono::milliseconds(g_api_timeout_ms);
    cfg.retries = g_api_retries;
    cfg.retry_delay = std::chrono::milliseconds(g_api_retry_delay_ms);
    return cfg;
}

} // namespace http_client_opts

// Static auto-registration object
namespace {
    struct HttpClientOptsAutoReg {
        HttpClientOptsAutoReg() { http_client_opts::register_options(); }
    };
    [[maybe_unused]] static HttpClientOptsAutoReg s_http_client_auto_reg;
}
