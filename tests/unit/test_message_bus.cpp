#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include "bus/BusClient.hpp"
#include "bus/MessageBus.hpp"
#include "message/Envelope.hpp"
#include "message/Frame.hpp"
#include "tests/util/test_support.hpp"

using namespace bus;
using HostBus::Envelope;
using HostBus::FrameKind;
using HostBus::MessageType;
using hostbus::test::make_logger;
using hostbus::test::wait_until;
using namespace std::chrono_literals;

// ─── Fixture ────────────────────────────────────────────────────────────────

class MessageBusTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        logger_ = make_logger();
        bus_ = std::make_unique<MessageBus>(logger_);
    }

    void TearDown() override
    {
        clients_.clear();
        bus_->stop_server();
    }

    BusEndpoint start(std::chrono::milliseconds heartbeat = 30000ms)
    {
        BusConfig config;
        config.heartbeat_interval = heartbeat;
        endpoint_ = bus_->start_server(config);
        return endpoint_;
    }

    BusClient& connect()
    {
        auto client = std::make_unique<BusClient>(logger_);
        std::error_code ec;
        EXPECT_TRUE(client->connect(endpoint_.host, endpoint_.port, ec)) << ec.message();
        clients_.push_back(std::move(client));
        return *clients_.back();
    }

    /// Connects and identifies as the worker, then waits until the bus has seen it.
    BusClient& connect_worker()
    {
        auto& worker = connect();
        EXPECT_TRUE(worker.identify(ClientRole::PythonAgent));
        EXPECT_TRUE(wait_until([&] { return bus_->is_worker_connected(); }));
        return worker;
    }

    std::shared_ptr<Logger> logger_;
    std::unique_ptr<MessageBus> bus_;
    BusEndpoint endpoint_;
    std::vector<std::unique_ptr<BusClient>> clients_;
};

// ─── Lifecycle ──────────────────────────────────────────────────────────────

TEST_F(MessageBusTest, StartBindsEphemeralPort)
{
    auto ep = start();
    EXPECT_EQ(ep.host, "127.0.0.1");
    EXPECT_GT(ep.port, 0);
    EXPECT_TRUE(bus_->is_running());

    auto info = bus_->get_server_info();
    EXPECT_TRUE(info.running);
    EXPECT_EQ(info.port, ep.port);
    EXPECT_EQ(info.client_count, 0u);
    EXPECT_FALSE(info.worker_connected);
}

TEST_F(MessageBusTest, StartIsIdempotent)
{
    auto first = start();
    BusConfig other;
    other.port = 1;
    auto second = bus_->start_server(other);
    EXPECT_EQ(second.port, first.port);
}

TEST_F(MessageBusTest, StopIsIdempotentAndResetsInfo)
{
    start();
    bus_->stop_server();
    bus_->stop_server();
    auto info = bus_->get_server_info();
    EXPECT_FALSE(info.running);
    EXPECT_EQ(info.port, 0);
    EXPECT_EQ(info.to_json()["running"], false);
}

TEST_F(MessageBusTest, NonPositiveHeartbeatIsRejected)
{
    BusConfig config;
    config.heartbeat_interval = 0ms;
    EXPECT_THROW(bus_->start_server(config), std::invalid_argument);
    EXPECT_FALSE(bus_->is_running());
}

TEST_F(MessageBusTest, OccupiedPortRaisesSystemError)
{
    auto ep = start();
    MessageBus second(logger_);
    BusConfig config;
    config.port = ep.port;
    EXPECT_THROW(second.start_server(config), std::system_error);
    EXPECT_FALSE(second.is_running());
}

TEST_F(MessageBusTest, StopDisconnectsClients)
{
    start();
    auto& client = connect();
    bus_->stop_server();
    EXPECT_FALSE(client.receive(2000ms).has_value());
    EXPECT_FALSE(client.is_connected());
}

// ─── Connections ────────────────────────────────────────────────────────────

TEST_F(MessageBusTest, ConnectionIsAcknowledgedWithId)
{
    start();
    auto& a = connect();
    auto& b = connect();
    EXPECT_EQ(a.client_id().rfind("client_", 0), 0u);
    EXPECT_NE(a.client_id(), b.client_id());

    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 2; }));
    auto ids = bus_->client_ids();
    EXPECT_NE(std::find(ids.begin(), ids.end(), a.client_id()), ids.end());
}

TEST_F(MessageBusTest, PingEnvelopeIsAnsweredWithPong)
{
    start();
    auto& client = connect();
    ASSERT_TRUE(client.send(Envelope::create(MessageType::PING)));
    auto pong = client.receive_type(MessageType::PONG, 2000ms);
    ASSERT_TRUE(pong.has_value());
    EXPECT_FALSE(pong->id().empty());
}

TEST_F(MessageBusTest, ClientCloseIsNoticed)
{
    start();
    auto& client = connect();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 1; }));
    client.close();
    EXPECT_TRUE(wait_until([&] { return bus_->client_count() == 0; }));
}

// ─── Routing ────────────────────────────────────────────────────────────────

TEST_F(MessageBusTest, RegisteredHandlerReceivesEnvelopeAndReplies)
{
    start();
    std::mutex m;
    std::string seen_from;
    bus_->on(MessageType::SYSTEM_STATUS, [&](const std::string& client_id, const Envelope& env) {
        {
            std::lock_guard<std::mutex> lk(m);
            seen_from = client_id;
        }
        bus_->send_to_client(client_id, Envelope::create(MessageType::SYSTEM_STATUS,
                                                         {{"echo", env.string_field("probe")}}));
    });

    auto& client = connect();
    ASSERT_TRUE(client.send(Envelope::create(MessageType::SYSTEM_STATUS, {{"probe", "x1"}})));
    auto reply = client.receive_type(MessageType::SYSTEM_STATUS, 2000ms);
    ASSERT_TRUE(reply.has_value());
    EXPECT_EQ(reply->string_field("echo"), "x1");
    std::lock_guard<std::mutex> lk(m);
    EXPECT_EQ(seen_from, client.client_id());
}

TEST_F(MessageBusTest, HandlerExceptionDoesNotDropConnection)
{
    start();
    bus_->on(MessageType::SYSTEM_STATUS,
             [](const std::string&, const Envelope&) { throw std::runtime_error("handler broke"); });
    auto& client = connect();
    ASSERT_TRUE(client.send(Envelope::create(MessageType::SYSTEM_STATUS)));
    ASSERT_TRUE(client.send(Envelope::create(MessageType::PING)));
    EXPECT_TRUE(client.receive_type(MessageType::PONG, 2000ms).has_value());
}

TEST_F(MessageBusTest, SendToUnknownClientReturnsFalse)
{
    start();
    EXPECT_FALSE(bus_->send_to_client("client_0_999", Envelope::create(MessageType::PONG)));
}

TEST_F(MessageBusTest, BroadcastReachesEveryClient)
{
    start();
    auto& a = connect();
    auto& b = connect();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 2; }));

    EXPECT_EQ(bus_->broadcast(Envelope::create(MessageType::PYTHON_LOG, {{"message", "hi"}})), 2u);
    for (auto* c : {&a, &b}) {
        auto env = c->receive_type(MessageType::PYTHON_LOG, 2000ms);
        ASSERT_TRUE(env.has_value());
        EXPECT_EQ(env->string_field("message"), "hi");
    }
}

TEST_F(MessageBusTest, BroadcastSkipsClosedClients)
{
    start();
    auto& gone = connect();
    auto& live = connect();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 2; }));

    gone.close();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 1; }));

    EXPECT_EQ(bus_->broadcast(Envelope::create(MessageType::PYTHON_LOG, {{"message", "after close"}})), 1u);
    auto env = live.receive_type(MessageType::PYTHON_LOG, 2000ms);
    ASSERT_TRUE(env.has_value());
    EXPECT_EQ(env->string_field("message"), "after close");
}

TEST_F(MessageBusTest, WorkerIdentityIsAnnouncedToRenderers)
{
    start();
    auto& renderer = connect();
    connect_worker();

    auto status = renderer.receive_type(MessageType::PYTHON_STATUS, 2000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->string_field("status"), "running");
    EXPECT_TRUE(bus_->get_server_info().worker_connected);
    EXPECT_EQ(bus_->broadcast_to_renderers(Envelope::create(MessageType::PYTHON_LOG)), 1u);
}

TEST_F(MessageBusTest, ChatWithoutWorkerIsAnsweredWithFailure)
{
    start();
    auto& renderer = connect();
    ASSERT_TRUE(renderer.send(Envelope::create(MessageType::CHAT_MESSAGE, {{"conversationId", 5}, {"content", "hi"}})));
    auto reply = renderer.receive_type(MessageType::CHAT_RESPONSE, 2000ms);
    ASSERT_TRUE(reply.has_value());
    EXPECT_FALSE(reply->value<bool>("success", true));
    EXPECT_EQ(reply->value<int>("conversationId", 0), 5);
}

TEST_F(MessageBusTest, ChatIsForwardedToWorkerAndAnswerFannedOut)
{
    start();
    auto& renderer = connect();
    auto& worker = connect_worker();

    ASSERT_TRUE(renderer.send(Envelope::create(MessageType::AGENT_CHAT, {{"content", "plan a trip"}})));
    auto forwarded = worker.receive_type(MessageType::AGENT_CHAT, 2000ms);
    ASSERT_TRUE(forwarded.has_value());
    EXPECT_EQ(forwarded->string_field("content"), "plan a trip");

    ASSERT_TRUE(worker.send(Envelope::create(MessageType::AGENT_STEP, {{"step", 1}})));
    auto step = renderer.receive_type(MessageType::AGENT_STEP, 2000ms);
    ASSERT_TRUE(step.has_value());
    EXPECT_EQ(step->value<int>("step", 0), 1);
}

TEST_F(MessageBusTest, WorkerDisconnectIsAnnounced)
{
    start();
    auto& renderer = connect();
    auto& worker = connect_worker();
    ASSERT_TRUE(renderer.receive_type(MessageType::PYTHON_STATUS, 2000ms).has_value());

    worker.close();
    auto status = renderer.receive_type(MessageType::PYTHON_STATUS, 2000ms);
    ASSERT_TRUE(status.has_value());
    EXPECT_EQ(status->string_field("status"), "stopped");
    EXPECT_FALSE(bus_->is_worker_connected());
}

// ─── Malformed input ────────────────────────────────────────────────────────

TEST_F(MessageBusTest, MalformedEnvelopeIsDropped)
{
    start();
    auto& client = connect();
    ASSERT_TRUE(client.send_raw(HostBus::encode_frame(FrameKind::Data, "{not json")));
    ASSERT_TRUE(client.send_raw(HostBus::encode_frame(FrameKind::Data, R"({"type":"no_such_type"})")));
    ASSERT_TRUE(client.send(Envelope::create(MessageType::PING)));
    EXPECT_TRUE(client.receive_type(MessageType::PONG, 2000ms).has_value());
    EXPECT_EQ(bus_->client_count(), 1u);
}

TEST_F(MessageBusTest, BadFrameHeaderClosesConnection)
{
    start();
    auto& client = connect();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 1; }));
    ASSERT_TRUE(client.send_raw(std::string(sizeof(HostBus::FrameHeader), 'x')));
    EXPECT_TRUE(wait_until([&] { return bus_->client_count() == 0; }));
    EXPECT_FALSE(client.receive(2000ms).has_value());
    EXPECT_FALSE(client.is_connected());
}

// ─── Heartbeat ──────────────────────────────────────────────────────────────

TEST_F(MessageBusTest, SilentClientIsEvictedResponsiveClientStays)
{
    start(100ms);
    auto& silent = connect();
    silent.set_auto_pong(false);
    auto& live = connect();

    std::atomic<bool> done{false};
    std::thread pump([&] {
        while (!done.load()) live.receive(20ms);
    });

    const bool evicted = wait_until([&] { return bus_->client_count() == 1; }, 3000ms);
    std::this_thread::sleep_for(300ms);
    const auto remaining = bus_->client_ids();
    done = true;
    pump.join();

    ASSERT_TRUE(evicted);
    ASSERT_EQ(remaining.size(), 1u);
    EXPECT_EQ(remaining.front(), live.client_id());
    EXPECT_GT(live.pings_received(), 0u);
}

TEST_F(MessageBusTest, HeartbeatPassKeepsFreshConnections)
{
    start();
    connect();
    ASSERT_TRUE(wait_until([&] { return bus_->client_count() == 1; }));
    EXPECT_EQ(bus_->run_heartbeat(), 0u);
    EXPECT_EQ(bus_->client_count(), 1u);
}

// ─── Client ─────────────────────────────────────────────────────────────────

TEST(BusClientTest, ConnectToClosedPortFails)
{
    auto logger = make_logger();
    BusConfig config;
    int port = 0;
    {
        MessageBus probe(logger);
        port = probe.start_server(config).port;
    }
    BusClient client(logger);
    std::error_code ec;
    EXPECT_FALSE(client.connect("127.0.0.1", port, ec, 1000ms));
    EXPECT_TRUE(static_cast<bool>(ec));
    EXPECT_FALSE(client.is_connected());
}

TEST(BusClientTest, NullLoggerIsRejected)
{
    EXPECT_THROW(BusClient(nullptr), std::invalid_argument);
}
