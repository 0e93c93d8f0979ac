#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "http/HttpClient.hpp"
#include "http/TcpHttpTransport.hpp"
#include "tests/util/test_support.hpp"
#include "transport/socket/IAsyncStream.hpp"
#include "transport/socket/SocketFactory.hpp"

using namespace http;
using hostbus::test::make_logger;
using namespace std::chrono_literals;

// ─── Helpers ─────────────────────────────────────────────────────────────────

namespace {

/// Transport replaying scripted outcomes and recording what was asked of it.
class ScriptedTransport : public IHttpTransport
{
   public:
    struct Outcome
    {
        std::error_code error;
        HttpResponse response;
    };

    void push_error(std::errc e) { outcomes_.push_back(Outcome{std::make_error_code(e), {}}); }
    void push_response(int status, std::string body)
    {
        HttpResponse r;
        r.status = status;
        r.body = std::move(body);
        outcomes_.push_back(Outcome{{}, std::move(r)});
    }

    HttpResponse perform(const HttpRequest& request, std::chrono::milliseconds timeout,
                         std::error_code& error) override
    {
        requests.push_back(request);
        timeouts.push_back(timeout);
        if (outcomes_.empty())
        {
            error = std::make_error_code(std::errc::connection_refused);
            return {};
        }
        auto next = std::move(outcomes_.front());
        outcomes_.pop_front();
        error = next.error;
        return next.response;
    }

    std::vector<HttpRequest> requests;
    std::vector<std::chrono::milliseconds> timeouts;

   private:
    std::deque<Outcome> outcomes_;
};

struct ClientUnderTest
{
    std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
    std::vector<std::chrono::milliseconds> sleeps;
    HttpClient client;

    explicit ClientUnderTest(HttpClientConfig config = {})
        : client(std::move(config), make_logger(), transport)
    {
        client.set_sleeper([this](std::chrono::milliseconds d) { sleeps.push_back(d); });
    }
};

std::string header(const HttpRequest& r, const std::string& name)
{
    for (const auto& [k, v] : r.headers)
    {
        if (k == name) return v;
    }
    return {};
}

/// Accepts one connection, captures the request and answers with `reply`.
class OneShotServer
{
   public:
    explicit OneShotServer(std::string reply)
        : reply_(std::move(reply)), listener_(transport::SocketFactory::create_async_server(make_logger()))
    {
        std::error_code ec;
        if (!listener_->start_listening("127.0.0.1", 0, 4, ec))
        {
            throw std::system_error(ec, "listen");
        }
        port_ = listener_->local_port();
        thread_ = std::thread([this] { serve(); });
    }
    ~OneShotServer()
    {
        if (thread_.joinable()) thread_.join();
        listener_->close();
    }

    int port() const { return port_; }
    std::string request()
    {
        if (thread_.joinable()) thread_.join();
        return request_;
    }

   private:
    void serve()
    {
        std::error_code ec;
        auto conn = listener_->blocking_accept(ec, 3000ms);
        if (!conn) return;
        const auto deadline = std::chrono::steady_clock::now() + 3s;
        char buf[1024];
        while (std::chrono::steady_clock::now() < deadline && !complete())
        {
            std::size_t n = 0;
            std::error_code rec;
            if (!conn->try_read(buf, sizeof(buf), n, rec))
            {
                std::this_thread::sleep_for(2ms);
                continue;
            }
            if (rec) break;
            request_.append(buf, n);
        }
        std::size_t off = 0;
        while (off < reply_.size() && std::chrono::steady_clock::now() < deadline)
        {
            std::size_t n = 0;
            std::error_code wec;
            if (!conn->try_write(reply_.data() + off, reply_.size() - off, n, wec))
            {
                std::this_thread::sleep_for(2ms);
                continue;
            }
            if (wec) break;
            off += n;
        }
        conn->close();
    }

    bool complete() const
    {
        const auto head_end = request_.find("\r\n\r\n");
        if (head_end == std::string::npos) return false;
        const auto cl = request_.find("Content-Length: ");
        if (cl == std::string::npos || cl > head_end) return true;
        const auto length = std::stoul(request_.substr(cl + 16));
        return request_.size() >= head_end + 4 + length;
    }

    std::string reply_;
    std::shared_ptr<IAsyncStream> listener_;
    int port_{0};
    std::string request_;
    std::thread thread_;
};

}   // namespace

// ─── Retry policy ───────────────────────────────────────────────────────────

TEST(HttpClientTest, ExhaustedRetriesReportLastErrorWithLinearBackoff)
{
    HttpClientConfig config;
    config.retries = 3;
    config.retry_delay = 100ms;
    ClientUnderTest t(config);
    t.transport->push_error(std::errc::connection_refused);
    t.transport->push_error(std::errc::connection_refused);
    t.transport->push_error(std::errc::timed_out);

    auto result = t.client.get("/api/knowledge");
    EXPECT_FALSE(result.success);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(*result.error, "Request timeout");
    EXPECT_EQ(t.transport->requests.size(), 3u);
    EXPECT_EQ(t.sleeps, (std::vector<std::chrono::milliseconds>{100ms, 200ms}));
}

TEST(HttpClientTest, RecoversOnLaterAttempt)
{
    ClientUnderTest t;
    t.transport->push_error(std::errc::connection_refused);
    t.transport->push_response(200, R"({"success":true,"data":{"id":"kb_1"}})");

    auto result = t.client.get("/api/knowledge/kb_1");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(result.data["id"], "kb_1");
    EXPECT_EQ(t.transport->requests.size(), 2u);
    EXPECT_EQ(t.sleeps.size(), 1u);
}

TEST(HttpClientTest, JsonErrorBodyIsNotRetried)
{
    ClientUnderTest t;
    t.transport->push_response(500, R"({"success":false,"error":"index corrupted"})");

    auto result = t.client.post("/api/knowledge/kb_1/rebuild");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "index corrupted");
    EXPECT_EQ(t.transport->requests.size(), 1u);
    EXPECT_TRUE(t.sleeps.empty());
}

TEST(HttpClientTest, NonJsonBodyIsRetriedAndReported)
{
    HttpClientConfig config;
    config.retries = 2;
    ClientUnderTest t(config);
    const std::string page = "<html>" + std::string(200, 'x') + "</html>";
    t.transport->push_response(502, page);
    t.transport->push_response(502, page);

    auto result = t.client.get("/api/health");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "Invalid JSON response: " + page.substr(0, 100));
    EXPECT_EQ(t.transport->requests.size(), 2u);
}

TEST(HttpClientTest, PerCallOverridesApply)
{
    ClientUnderTest t;
    RequestOptions options;
    options.timeout = 250ms;
    options.retries = 1;
    options.headers = {{"X-Trace", "abc"}};

    auto result = t.client.del("/api/memory/3", options);
    EXPECT_FALSE(result.success);
    ASSERT_EQ(t.transport->requests.size(), 1u);
    EXPECT_EQ(t.transport->timeouts.front(), 250ms);
    EXPECT_EQ(header(t.transport->requests.front(), "X-Trace"), "abc");
    EXPECT_TRUE(t.sleeps.empty());
}

// ─── Request shaping and results ────────────────────────────────────────────

TEST(HttpClientTest, RequestCarriesJsonHeadersAndBody)
{
    ClientUnderTest t;
    t.transport->push_response(201, R"({"success":true,"data":{"id":3},"message":"created"})");

    auto result = t.client.put("api/memory", {{"memoryKey", "editor"}});
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.message.value_or(""), "created");

    const auto& req = t.transport->requests.front();
    EXPECT_EQ(req.method, HttpMethod::Put);
    EXPECT_EQ(req.host, "127.0.0.1");
    EXPECT_EQ(req.port, 8766);
    EXPECT_EQ(req.target, "/api/memory");
    EXPECT_EQ(req.body, R"({"memoryKey":"editor"})");
    EXPECT_EQ(header(req, "Content-Type"), "application/json");
    EXPECT_EQ(header(req, "Connection"), "close");
}

TEST(HttpClientTest, AbsoluteUrlOverridesBase)
{
    ClientUnderTest t;
    t.transport->push_response(200, "[1,2]");
    auto result = t.client.get("http://localhost:9001/items?limit=2");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.data, nlohmann::json::array({1, 2}));

    const auto& req = t.transport->requests.front();
    EXPECT_EQ(req.host, "localhost");
    EXPECT_EQ(req.port, 9001);
    EXPECT_EQ(req.target, "/items?limit=2");
}

TEST(HttpClientTest, HttpsIsRefusedWithoutNetworkAttempt)
{
    ClientUnderTest t;
    auto result = t.client.get("https://example.org/");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or("").rfind("Unsupported URL scheme", 0), 0u);
    EXPECT_TRUE(t.transport->requests.empty());
}

TEST(HttpClientTest, PlainJsonStatusDecidesSuccess)
{
    ClientUnderTest t;
    t.transport->push_response(404, R"({"detail":"Not Found"})");
    auto result = t.client.get("/missing");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error.value_or(""), "HTTP 404");
    EXPECT_EQ(result.data["detail"], "Not Found");
    EXPECT_EQ(result.to_json()["error"], "HTTP 404");
}

// ─── Health ─────────────────────────────────────────────────────────────────

TEST(HttpClientTest, HealthRequiresHealthyStatus)
{
    ClientUnderTest t;
    t.transport->push_response(200, R"({"success":true,"data":{"status":"healthy"}})");
    EXPECT_TRUE(t.client.check_health());
    EXPECT_EQ(t.transport->timeouts.back(), 2000ms);
    EXPECT_EQ(t.transport->requests.back().target, "/health");

    t.transport->push_response(200, R"({"success":true,"data":{"status":"starting"}})");
    EXPECT_FALSE(t.client.check_health());
    t.transport->push_response(200, R"({"success":true,"data":{"status":1}})");
    EXPECT_FALSE(t.client.check_health());
    EXPECT_FALSE(t.client.check_health());
    EXPECT_EQ(t.transport->requests.size(), 4u);
}

TEST(HttpClientTest, WaitForReadyPollsUntilHealthy)
{
    ClientUnderTest t;
    t.transport->push_error(std::errc::connection_refused);
    t.transport->push_response(200, R"({"status":"healthy"})");
    EXPECT_TRUE(t.client.wait_for_ready(10s, 50ms));
    EXPECT_EQ(t.transport->requests.size(), 2u);
    EXPECT_EQ(t.sleeps, (std::vector<std::chrono::milliseconds>{50ms}));
}

TEST(HttpClientTest, WaitForReadyGivesUp)
{
    ClientUnderTest t;
    t.client.set_sleeper([](std::chrono::milliseconds) { std::this_thread::sleep_for(5ms); });
    EXPECT_FALSE(t.client.wait_for_ready(50ms, 5ms));
    EXPECT_GE(t.transport->requests.size(), 1u);
}

TEST(HttpClientTest, NullLoggerIsRejected)
{
    EXPECT_THROW(HttpClient(HttpClientConfig{}, nullptr), std::invalid_argument);
}

// ─── Wire format ────────────────────────────────────────────────────────────

TEST(HttpParseTest, ContentLengthBody)
{
    HttpResponse r;
    std::string error;
    const std::string raw = "HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 2\r\n\r\n{}";
    EXPECT_EQ(parse_response(raw.substr(0, raw.size() - 1), false, r, error), ParseStatus::Incomplete);
    ASSERT_EQ(parse_response(raw, false, r, error), ParseStatus::Complete);
    EXPECT_EQ(r.status, 200);
    EXPECT_EQ(r.reason, "OK");
    EXPECT_EQ(r.headers["content-type"], "application/json");
    EXPECT_EQ(r.body, "{}");
}

TEST(HttpParseTest, ChunkedBody)
{
    HttpResponse r;
    std::string error;
    const std::string raw =
        "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\n4\r\n{\"a\"\r\n3\r\n:1}\r\n0\r\n\r\n";
    ASSERT_EQ(parse_response(raw, false, r, error), ParseStatus::Complete) << error;
    EXPECT_EQ(r.body, "{\"a\":1}");

    const std::string bad = "HTTP/1.1 200 OK\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n";
    EXPECT_EQ(parse_response(bad, false, r, error), ParseStatus::Invalid);
    EXPECT_NE(error.find("bad chunk size"), std::string::npos);
}

TEST(HttpParseTest, BodyUntilCloseAndTruncation)
{
    HttpResponse r;
    std::string error;
    EXPECT_EQ(parse_response("HTTP/1.0 200 OK\r\n\r\n[1]", false, r, error), ParseStatus::Incomplete);
    ASSERT_EQ(parse_response("HTTP/1.0 200 OK\r\n\r\n[1]", true, r, error), ParseStatus::Complete);
    EXPECT_EQ(r.body, "[1]");

    EXPECT_EQ(parse_response("HTTP/1.1 200 OK\r\nContent-Length: 10\r\n\r\nabc", true, r, error),
              ParseStatus::Invalid);
    EXPECT_EQ(error, "body truncated at 3 of 10 bytes");
}

TEST(HttpParseTest, RejectsNonHttp)
{
    HttpResponse r;
    std::string error;
    EXPECT_EQ(parse_response("", true, r, error), ParseStatus::Invalid);
    EXPECT_EQ(error, "empty response");
    EXPECT_EQ(parse_response("SSH-2.0-OpenSSH\r\n\r\n", false, r, error), ParseStatus::Invalid);
    EXPECT_EQ(error, "not an HTTP response");
}

TEST(HttpParseTest, NoContentHasEmptyBody)
{
    HttpResponse r;
    std::string error;
    ASSERT_EQ(parse_response("HTTP/1.1 204 No Content\r\n\r\n", false, r, error), ParseStatus::Complete);
    EXPECT_TRUE(r.body.empty());
}

TEST(HttpParseTest, FormatRequestAddsHostAndLength)
{
    HttpRequest req;
    req.method = HttpMethod::Post;
    req.host = "127.0.0.1";
    req.port = 8766;
    req.target = "/api/x";
    req.headers = {{"Content-Type", "application/json"}};
    EXPECT_EQ(TcpHttpTransport::format_request(req),
              "POST /api/x HTTP/1.1\r\nHost: 127.0.0.1:8766\r\nContent-Type: application/json\r\n"
              "Content-Length: 0\r\n\r\n");
}

// ─── Real socket ────────────────────────────────────────────────────────────

TEST(TcpHttpTransportTest, RoundTripOverLoopback)
{
    OneShotServer server("HTTP/1.1 200 OK\r\nContent-Type: application/json\r\nContent-Length: 40\r\n"
                         "Connection: close\r\n\r\n{\"success\":true,\"data\":{\"saved\":true}}  ");
    HttpClientConfig config;
    config.port = server.port();
    config.retries = 1;
    HttpClient client(config, make_logger());

    auto result = client.post("/api/memory", {{"memoryKey", "k"}});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.data["saved"], true);

    const auto request = server.request();
    EXPECT_EQ(request.rfind("POST /api/memory HTTP/1.1\r\n", 0), 0u);
    EXPECT_NE(request.find("Content-Length: 17\r\n"), std::string::npos);
    EXPECT_NE(request.find("\r\n\r\n{\"memoryKey\":\"k\"}"), std::string::npos);
}

TEST(TcpHttpTransportTest, RefusedConnectionIsReported)
{
    int port = 0;
    {
        auto probe = transport::SocketFactory::create_async_server(make_logger());
        std::error_code ec;
        ASSERT_TRUE(probe->start_listening("127.0.0.1", 0, 1, ec));
        port = probe->local_port();
        probe->close();
    }
    TcpHttpTransport transport(make_logger());
    HttpRequest req;
    req.host = "127.0.0.1";
    req.port = port;
    std::error_code ec;
    transport.perform(req, 1000ms, ec);
    EXPECT_TRUE(static_cast<bool>(ec));
}
