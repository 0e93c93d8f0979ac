#include "MessageBus.hpp"
#include "processUtils.hpp"
#include "transport/socket/SocketFactory.hpp"

#include <chrono>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace bus {

using HostBus::Envelope;
using HostBus::MessageType;

namespace {

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

constexpr auto kAcceptSlice = std::chrono::milliseconds(500);
constexpr auto kSessionDrainBudget = std::chrono::milliseconds(1000);

} // namespace

MessageBus::MessageBus(std::shared_ptr<Logger> logger)
    : logger_(std::move(logger))
    , router_(registry_, logger_) {
    if (!logger_) {
        throw std::invalid_argument("MessageBus requires a logger");
    }
}

MessageBus::~MessageBus() {
    stop_server();
}

BusEndpoint MessageBus::start_server(const BusConfig& config) {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (running_) {
        return endpoint_;
    }
    if (config.heartbeat_interval.count() <= 0) {
        throw std::invalid_argument("MessageBus: heartbeat interval must be positive");
    }
    config_ = config;

    io_ = std::make_shared<transport::CoroIoContext>();
    io_->set_logger(logger_);
    io_->start(config_.io_threads);
    io_guard_.emplace(io_->make_work_guard());

    auto stream = transport::SocketFactory::create_async_server(logger_);
    listener_ = std::make_shared<transport::CoroSocketAdapter>(stream, logger_, io_);

    std::error_code ec;
    if (!listener_->start_listening(config_.host, config_.port, config_.backlog, ec)) {
        listener_.reset();
        io_guard_.reset();
        io_->stop();
        io_.reset();
        if (!ec) ec = std::make_error_code(std::errc::address_not_available);
        logger_->error("MessageBus: failed to listen on " + config_.host + ":" + std::to_string(config_.port) +
                       ": " + ec.message());
        throw std::system_error(ec, "MessageBus: cannot listen on " + config_.host + ":" + std::to_string(config_.port));
    }

    endpoint_ = BusEndpoint{config_.host, listener_->local_port()};
    running_ = true;
    acceptor_thread_ = std::thread([this] { acceptor_loop(); });

    heartbeat_ = std::make_unique<PeriodicTimer>("hb-heartbeat", config_.heartbeat_interval,
                                                 [this] { run_heartbeat(); }, logger_);
    heartbeat_->start();

    logger_->info("MessageBus: listening on " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
                  ", heartbeat " + std::to_string(config_.heartbeat_interval.count()) + " ms");
    return endpoint_;
}

void MessageBus::stop_server() {
    std::lock_guard<std::mutex> lk(lifecycle_mutex_);
    if (!running_.exchange(false)) {
        return;
    }

    // 1. heartbeat
    if (heartbeat_) {
        heartbeat_->cancel();
        heartbeat_.reset();
    }

    // 2. connections
    auto sessions = registry_.take_all();
    for (const auto& s : sessions) s->close();

    // 3. listener; the acceptor observes running_ within one accept slice
    if (acceptor_thread_.joinable()) {
        acceptor_thread_.join();
    }
    for (const auto& s : registry_.take_all()) {
        s->close();
        sessions.push_back(s);
    }
    if (listener_) {
        listener_->close();
        listener_.reset();
    }
    wait_for_sessions(sessions, kSessionDrainBudget);

    // 4. I/O loop
    io_guard_.reset();
    if (io_) {
        io_->stop();
    }
    const auto dropped = registry_.purge_retired(true);
    io_.reset();
    logger_->info("MessageBus: stopped (" + std::to_string(sessions.size()) + " connection(s) closed, " +
                  std::to_string(dropped) + " session(s) released)");
}

void MessageBus::wait_for_sessions(const std::vector<std::shared_ptr<ClientSession>>& sessions,
                                   std::chrono::milliseconds budget) {
    const auto deadline = std::chrono::steady_clock::now() + budget;
    for (const auto& s : sessions) {
        while (!s->is_done() && std::chrono::steady_clock::now() < deadline) {
            std::this_thread::sleep_for(std::chrono::milliseconds(5));
        }
    }
}

void MessageBus::acceptor_loop() {
    ProcessUtils::set_current_thread_name("hb-acceptor");
    while (running_) {
        try {
            std::error_code ec;
            auto client = listener_->blocking_accept(ec, kAcceptSlice);
            if (!client) {
                if (ec && running_) {
                    logger_->error("MessageBus: accept error: " + ec.message());
                    std::this_thread::sleep_for(std::chrono::milliseconds(50));
                }
                continue;
            }
            if (!running_) {
                client->close();
                break;
            }
            accept_client(std::move(client));
            registry_.purge_retired();
        } catch (const std::exception& e) {
            logger_->error(std::string("MessageBus: accept exception: ") + e.what());
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    }
}

std::string MessageBus::next_client_id() {
    return "client_" + std::to_string(epoch_ms()) + "_" + std::to_string(client_seq_.fetch_add(1) + 1);
}

void MessageBus::accept_client(std::shared_ptr<transport::CoroSocketAdapter> adapter) {
    auto session = std::make_shared<ClientSession>(std::move(adapter), next_client_id(), config_, logger_);
    registry_.add(session);
    logger_->info("MessageBus: client " + session->id() + " connected from " + session->endpoint() +
                  " (" + std::to_string(registry_.size()) + " total)");

    session->send(Envelope::create(MessageType::CONNECTION_ACK, {{"clientId", session->id()}}));

    session->run(
        [this](const std::shared_ptr<ClientSession>& s, std::string&& body) { handle_data(s, std::move(body)); },
        [this](const std::shared_ptr<ClientSession>& s, const std::string& reason) { handle_close(s, reason); });
}

void MessageBus::handle_data(const std::shared_ptr<ClientSession>& session, std::string&& body) {
    std::string error;
    auto envelope = Envelope::parse(body, error);
    if (!envelope) {
        logger_->warning("MessageBus: dropped malformed message from " + session->id() + ": " + error);
        return;
    }
    try {
        router_.route(session, *envelope);
    } catch (const std::exception& e) {
        logger_->error("MessageBus: handler for " + HostBus::to_string(envelope->type()) + " from " +
                       session->id() + " failed: " + e.what());
    }
}

void MessageBus::handle_close(const std::shared_ptr<ClientSession>& session, const std::string& reason) {
    if (!registry_.remove(session->id())) {
        return;  // evicted or shut down already
    }
    logger_->info("MessageBus: client " + session->id() + " disconnected (" + reason + ")");
    try {
        router_.client_closed(*session);
    } catch (const std::exception& e) {
        logger_->error(std::string("MessageBus: close bookkeeping failed: ") + e.what());
    }
}

std::size_t MessageBus::run_heartbeat() {
    const auto now = ClientSession::Clock::now();
    const auto limit = 2 * config_.heartbeat_interval;
    std::size_t evicted = 0;
    for (const auto& s : registry_.snapshot()) {
        if (now - s->last_activity() > limit) {
            if (!registry_.remove(s->id())) continue;
            logger_->warning("MessageBus: evicting " + s->id() + ", no activity for " +
                             std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(
                                 now - s->last_activity()).count()) + " ms");
            s->abort();
            router_.client_closed(*s);
            ++evicted;
        } else if (s->is_open()) {
            s->send_ping();
        }
    }
    registry_.purge_retired();
    return evicted;
}

std::size_t MessageBus::broadcast(const Envelope& envelope) {
    const auto frame = HostBus::encode_frame(HostBus::FrameKind::Data, envelope.serialize());
    const auto delivered = registry_.deliver(frame);
    logger_->debug("MessageBus: broadcast " + HostBus::to_string(envelope.type()) + " to " +
                   std::to_string(delivered) + " client(s)");
    return delivered;
}

std::size_t MessageBus::broadcast_to_renderers(const Envelope& envelope) {
    return router_.broadcast_to_renderers(envelope);
}

bool MessageBus::send_to_client(const std::string& client_id, const Envelope& envelope) noexcept {
    try {
        auto session = registry_.find(client_id);
        if (!session || !session->is_open()) {
            logger_->debug("MessageBus: client " + client_id + " not connected");
            return false;
        }
        return session->send(envelope);
    } catch (const std::exception& e) {
        logger_->error("MessageBus: send to " + client_id + " failed: " + e.what());
        return false;
    }
}

void MessageBus::on(MessageType type, Handler handler) {
    router_.on(type, std::move(handler));
}

ServerInfo MessageBus::get_server_info() const {
    ServerInfo info;
    info.running = running_.load();
    if (info.running) {
        info.host = endpoint_.host;
        info.port = endpoint_.port;
    }
    info.client_count = registry_.size();
    info.worker_connected = registry_.has_role(ClientRole::PythonAgent);
    return info;
}

std::size_t MessageBus::client_count() const {
    return registry_.size();
}

std::vector<std::string> MessageBus::client_ids() const {
    return registry_.ids();
}

bool MessageBus::is_worker_connected() const {
    return registry_.has_role(ClientRole::PythonAgent);
}

} // namespace bus
