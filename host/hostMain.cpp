// hostMain.cpp - hostbus composition root: worker supervisor, message bus, bridge and data-plane client.
#include "BridgeEndpoint.hpp"
#include "DomainSyncEndpoint.hpp"
#include "HostOptions.hpp"
#include "SupervisorRelay.hpp"
#include "bridge/builtins/BuiltinBridges.hpp"
#include "bridge/registry/BridgeRegistry.hpp"
#include "bridge/services/InMemoryServices.hpp"
#include "bus/MessageBus.hpp"
#include "bus/MessageBusOptions.hpp"
#include "http/HttpClient.hpp"
#include "http/HttpClientOptions.hpp"
#include "options/Options.hpp"
#include "supervisor/ProcessSupervisor.hpp"
#include "supervisor/SupervisorOptions.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <system_error>
#include <thread>

// Global shutdown flag for signal handlers
static std::atomic<bool> shutdown_requested{false};

static void signal_handler(int) {
    shutdown_requested.store(true, std::memory_order_relaxed);
}

int main(int argc, char* argv[]) {

    // --- Stage 1: Build logging pipeline ---
    auto logger = std::make_shared<Logger>("hostbus");
    auto stdout_sink = std::make_shared<StdoutSink>();
    stdout_sink->set_level(LogLevel::Info);
    logger->add_sink(stdout_sink);

    try {

        // --- Stage 2: Parse CLI/JSON options ---

        // Providers live in static libraries; register them explicitly so the linker keeps them.
        message_bus_opts::register_options();
        supervisor_opts::register_options();
        http_client_opts::register_options();
        host_opts::register_options();

        std::string opts_err;
        auto parse_res = shared_opts::Options::load_and_parse(argc, argv, opts_err);
        if (parse_res == shared_opts::Options::ParseResult::Help || parse_res == shared_opts::Options::ParseResult::Version) {
            return 0; // help/version already printed
        } else if (parse_res == shared_opts::Options::ParseResult::Error) {
            logger->error(std::string("Failed to parse options: ") + opts_err);
            return 2;
        }

        const auto settings = host_opts::get_settings();
        if (auto level = parse_log_level(settings.log_level)) {
            logger->set_level(*level);
        }

        // --- Stage 3: Bridge catalog over the domain services ---
        HostBus::Bridge::BridgeServices services{
            std::make_shared<HostBus::Bridge::InMemoryKnowledgeService>(),
            std::make_shared<HostBus::Bridge::InMemoryConversationService>(),
            std::make_shared<HostBus::Bridge::InMemoryMemoryService>(),
            std::make_shared<HostBus::Bridge::InMemoryUserService>(),
        };
        HostBus::Bridge::BridgeRegistry registry(logger);
        HostBus::Bridge::register_builtin_bridges(registry, services);
        registry.seal();
        logger->info("Bridge registry sealed with " + std::to_string(registry.method_count()) + " methods");

        // --- Stage 4: Message bus ---
        bus::MessageBus message_bus(logger);
        host::BridgeEndpoint bridge_endpoint(message_bus, registry, logger);
        bridge_endpoint.attach();
        host::DomainSyncEndpoint sync_endpoint(message_bus, services.knowledge, logger);
        sync_endpoint.attach();

        bus::BusEndpoint endpoint;
        try {
            endpoint = message_bus.start_server(message_bus_opts::get_bus_config());
        } catch (const std::system_error& e) {
            logger->error(std::string("Failed to start message bus: ") + e.what());
            return 3;
        } catch (const std::invalid_argument& e) {
            logger->error(std::string("Failed to start message bus: ") + e.what());
            return 3;
        }

        // --- Stage 5: Worker supervision and data plane ---
        supervisor::ProcessSupervisor service(logger);
        host::SupervisorRelay relay(message_bus, service, logger);
        relay.attach();

        http::HttpClient api(http_client_opts::get_client_config(), logger);

        if (settings.auto_start_service) {
            auto config = supervisor_opts::get_service_config();
            config.env["HOSTBUS_BUS_HOST"] = endpoint.host;
            config.env["HOSTBUS_BUS_PORT"] = std::to_string(endpoint.port);
            const auto started = service.start(config);
            if (!started.success) {
                logger->error("Worker failed to start: " + started.error);
            } else if (settings.wait_ready.count() > 0) {
                if (!api.wait_for_ready(settings.wait_ready)) {
                    logger->warning("Worker HTTP API at " + api.base_url() + " is not answering; continuing");
                }
            }
        }

        // --- Stage 6: Run until signalled ---
        std::signal(SIGTERM, signal_handler);
        std::signal(SIGINT, signal_handler);
        logger->info("hostbus running; bus on " + endpoint.host + ":" + std::to_string(endpoint.port));
        while (!shutdown_requested.load(std::memory_order_relaxed)) {
            std::this_thread::sleep_for(std::chrono::milliseconds(200));
        }

        logger->info("Shutting down...");
        relay.detach();
        service.stop();
        message_bus.stop_server();

    } catch (const std::exception& e) {
        logger->error("Exception in hostbus main: " + std::string(e.what()));
        return 1;
    }

    // --- Stage 7: Final shutdown log ---
    logger->info("hostbus shut down successfully");
    return 0;
}
