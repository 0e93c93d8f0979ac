#include "HttpClient.hpp"
#include "TcpHttpTransport.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace http {

namespace {
constexpr auto kHealthTimeout = std::chrono::milliseconds(2000);
constexpr std::size_t kBodyPreview = 100;
}

HttpClient::HttpClient(HttpClientConfig config, std::shared_ptr<Logger> logger,
                       std::shared_ptr<IHttpTransport> transport)
    : config_(std::move(config))
    , logger_(std::move(logger))
    , transport_(std::move(transport))
    , sleeper_([](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); }) {
    if (!logger_) {
        throw std::invalid_argument("HttpClient requires a logger");
    }
    if (!transport_) {
        transport_ = std::make_shared<TcpHttpTransport>(logger_);
    }
}

std::string HttpClient::base_url() const {
    return "http://" + config_.host + ":" + std::to_string(config_.port);
}

ApiResult HttpClient::get(const std::string& path, const RequestOptions& options) {
    return request(HttpMethod::Get, path, nullptr, options);
}

ApiResult HttpClient::post(const std::string& path, const nlohmann::json& body, const RequestOptions& options) {
    return request(HttpMethod::Post, path, body, options);
}

ApiResult HttpClient::put(const std::string& path, const nlohmann::json& body, const RequestOptions& options) {
    return request(HttpMethod::Put, path, body, options);
}

ApiResult HttpClient::del(const std::string& path, const RequestOptions& options) {
    return request(HttpMethod::Delete, path, nullptr, options);
}

bool HttpClient::resolve(const std::string& path, HttpRequest& request, std::string& error) const {
    static const std::string kScheme = "http://";
    if (path.rfind(kScheme, 0) != 0) {
        if (path.rfind("https://", 0) == 0) {
            error = "Unsupported URL scheme: " + path;
            return false;
        }
        request.host = config_.host;
        request.port = config_.port;
        request.target = path.empty() || path.front() != '/' ? "/" + path : path;
        return true;
    }

    const auto authority_start = kScheme.size();
    const auto slash = path.find('/', authority_start);
    const auto authority = path.substr(authority_start, slash == std::string::npos ? std::string::npos
                                                                                   : slash - authority_start);
    request.target = slash == std::string::npos ? "/" : path.substr(slash);
    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        request.host = authority;
        request.port = 80;
    } else {
        request.host = authority.substr(0, colon);
        try {
            request.port = std::stoi(authority.substr(colon + 1));
        } catch (const std::exception&) {
            error = "Invalid port in URL: " + path;
            return false;
        }
    }
    if (request.host.empty()) {
        error = "Missing host in URL: " + path;
        return false;
    }
    return true;
}

std::optional<ApiResult> HttpClient::interpret(const HttpResponse& response) {
    auto doc = nlohmann::json::parse(response.body, nullptr, false);
    if (doc.is_discarded()) {
        return std::nullopt;
    }
    ApiResult result;
    if (doc.is_object() && doc.contains("success")) {
        result.success = doc["success"].is_boolean() && doc["success"].get<bool>();
        if (doc.contains("data")) result.data = doc["data"];
        if (auto it = doc.find("error"); it != doc.end() && it->is_string()) result.error = it->get<std::string>();
        if (auto it = doc.find("message"); it != doc.end() && it->is_string()) result.message = it->get<std::string>();
    } else {
        result.success = response.is_success();
        result.data = std::move(doc);
        if (!result.success) result.error = "HTTP " + std::to_string(response.status);
    }
    return result;
}

ApiResult HttpClient::request(HttpMethod method, const std::string& path, const nlohmann::json& body,
                              const RequestOptions& options) {
    HttpRequest req;
    req.method = method;
    std::string error;
    if (!resolve(path, req, error)) {
        logger_->error("HTTP " + std::string(to_string(method)) + " " + path + ": " + error);
        return ApiResult::failure(error);
    }
    req.headers.emplace_back("Content-Type", "application/json");
    req.headers.emplace_back("Connection", "close");
    for (const auto& h : options.headers) req.headers.push_back(h);
    if (!body.is_null()) req.body = body.dump();

    const auto timeout = options.timeout.value_or(config_.timeout);
    const int attempts = std::max(1, options.retries.value_or(config_.retries));

    for (int attempt = 1; attempt <= attempts; ++attempt) {
        std::error_code ec;
        auto response = transport_->perform(req, timeout, ec);
        if (ec) {
            error = ec == std::errc::timed_out ? std::string("Request timeout") : ec.message();
        } else if (auto result = interpret(response)) {
            return *result;
        } else {
            error = "Invalid JSON response: " + response.body.substr(0, kBodyPreview);
        }

        logger_->warning("HTTP " + std::string(to_string(method)) + " " + path + " failed (attempt " +
                         std::to_string(attempt) + "/" + std::to_string(attempts) + "): " + error);
        if (attempt < attempts) {
            sleeper_(config_.retry_delay * attempt);
        }
    }
    return ApiResult::failure(error);
}

bool HttpClient::check_health() {
    RequestOptions opts;
    opts.timeout = kHealthTimeout;
    opts.retries = 1;
    const auto result = get("/health", opts);
    if (!result.success || !result.data.is_object()) return false;
    const auto status = result.data.find("status");
    return status != result.data.end() && status->is_string() && status->get<std::string>() == "healthy";
}

bool HttpClient::wait_for_ready(std::chrono::milliseconds max_wait, std::chrono::milliseconds interval) {
    const auto start = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - start < max_wait) {
        if (check_health()) {
            logger_->info("HTTP: data service at " + base_url() + " is ready");
            return true;
        }
        sleeper_(interval);
    }
    logger_->error("HTTP: data service at " + base_url() + " not ready after " +
                   std::to_string(max_wait.count()) + " ms");
    return false;
}

} // namespace http
