#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

#include "bus/MessageBusOptions.hpp"
#include "host/HostOptions.hpp"
#include "http/HttpClientOptions.hpp"
#include "options/Options.hpp"
#include "supervisor/SupervisorOptions.hpp"
#include "tests/util/test_support.hpp"

using shared_opts::Options;
using hostbus::test::TempDir;
using namespace std::chrono_literals;

// ─── Fixture ────────────────────────────────────────────────────────────────

// Providers are process-wide and registered once, so every test reparses from
// scratch instead of clearing them.
class OptionsTest : public ::testing::Test
{
   protected:
    static void SetUpTestSuite()
    {
        host_opts::register_options();
        message_bus_opts::register_options();
        supervisor_opts::register_options();
        http_client_opts::register_options();
    }

    Options::ParseResult parse(std::vector<std::string> args)
    {
        args.insert(args.begin(), "hostbus");
        std::vector<char*> argv;
        for (auto& a : args) argv.push_back(a.data());
        error_.clear();
        return Options::load_and_parse(static_cast<int>(argv.size()), argv.data(), error_);
    }

    std::string write_config(const std::string& text)
    {
        const auto path = dir_.path() / "hostbus.json";
        std::ofstream(path) << text;
        return path.string();
    }

    TempDir dir_;
    std::string error_;
};

// ─── Defaults ───────────────────────────────────────────────────────────────

TEST_F(OptionsTest, DefaultsWithoutArguments)
{
    ASSERT_EQ(parse({}), Options::ParseResult::Ok) << error_;

    auto bus = message_bus_opts::get_bus_config();
    EXPECT_EQ(bus.host, "127.0.0.1");
    EXPECT_EQ(bus.port, 0);
    EXPECT_EQ(bus.heartbeat_interval, 30000ms);
    EXPECT_EQ(bus.io_threads, 1u);

    auto api = http_client_opts::get_client_config();
    EXPECT_EQ(api.port, 8766);
    EXPECT_EQ(api.retries, 3);
    EXPECT_EQ(api.retry_delay, 500ms);

    auto service = supervisor_opts::get_service_config();
    EXPECT_EQ(service.port, supervisor::kDefaultServicePort);
    EXPECT_TRUE(service.auto_restart);
    EXPECT_EQ(service.max_restarts, 3);
    EXPECT_TRUE(service.no_restart_exit_codes.empty());

    auto host = host_opts::get_settings();
    EXPECT_EQ(host.log_level, "info");
    EXPECT_TRUE(host.auto_start_service);
    EXPECT_EQ(host.wait_ready, 30000ms);
    EXPECT_FALSE(Options::get_config_file().has_value());
}

// ─── Config file ────────────────────────────────────────────────────────────

TEST_F(OptionsTest, ConfigFileSeedsValues)
{
    const auto path = write_config(R"({
        "message_bus": {"port": 47001, "heartbeat_ms": 1500},
        "http_client": {"port": 9100, "retries": 5},
        "supervisor": {"service_dir": "agent", "max_restarts": 1, "no_restart_exit_codes": [0, 42]},
        "host": {"log_level": "debug", "auto_start_service": false}
    })");
    ASSERT_EQ(parse({"-c", path}), Options::ParseResult::Ok) << error_;

    EXPECT_EQ(message_bus_opts::get_bus_config().port, 47001);
    EXPECT_EQ(message_bus_opts::get_bus_config().heartbeat_interval, 1500ms);
    EXPECT_EQ(http_client_opts::get_client_config().port, 9100);
    EXPECT_EQ(http_client_opts::get_client_config().retries, 5);

    auto service = supervisor_opts::get_service_config();
    EXPECT_EQ(service.service_dir, (dir_.path() / "agent").lexically_normal());
    EXPECT_EQ(service.max_restarts, 1);
    EXPECT_EQ(service.no_restart_exit_codes, (std::vector<int>{0, 42}));

    EXPECT_EQ(host_opts::get_settings().log_level, "debug");
    EXPECT_FALSE(host_opts::get_settings().auto_start_service);
    ASSERT_TRUE(Options::get_config_dir().has_value());
}

TEST_F(OptionsTest, CommandLineOverridesConfigFile)
{
    const auto path = write_config(R"({"message_bus": {"port": 47001}, "supervisor": {"max_restarts": 1}})");
    ASSERT_EQ(parse({"--config", path, "--bus-port", "47002", "--max-restarts", "7",
                     "--no-restart-exit-code", "3", "--no-restart-exit-code", "4"}),
              Options::ParseResult::Ok)
        << error_;
    EXPECT_EQ(message_bus_opts::get_bus_config().port, 47002);
    auto service = supervisor_opts::get_service_config();
    EXPECT_EQ(service.max_restarts, 7);
    EXPECT_EQ(service.no_restart_exit_codes, (std::vector<int>{3, 4}));
}

TEST_F(OptionsTest, WrongTypedConfigValueFallsBackToDefault)
{
    const auto path = write_config(R"({"http_client": {"port": "ninety"}})");
    ASSERT_EQ(parse({"-c", path}), Options::ParseResult::Ok) << error_;
    EXPECT_EQ(http_client_opts::get_client_config().port, 8766);
}

TEST_F(OptionsTest, MalformedConfigIsAnError)
{
    const auto path = write_config("{\"message_bus\": ");
    EXPECT_EQ(parse({"-c", path}), Options::ParseResult::Error);
    EXPECT_NE(error_.find("malformed config file"), std::string::npos);
}

TEST_F(OptionsTest, NonObjectConfigIsAnError)
{
    const auto path = write_config("[1, 2]");
    EXPECT_EQ(parse({"-c", path}), Options::ParseResult::Error);
    EXPECT_NE(error_.find("must contain a JSON object"), std::string::npos);
}

TEST_F(OptionsTest, MissingConfigIsAnError)
{
    EXPECT_EQ(parse({"-c", (dir_.path() / "absent.json").string()}), Options::ParseResult::Error);
    EXPECT_NE(error_.find("cannot open config file"), std::string::npos);
}

// ─── Validation ─────────────────────────────────────────────────────────────

TEST_F(OptionsTest, OutOfRangeValuesAreRejected)
{
    EXPECT_EQ(parse({"--bus-port", "70000"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--bus-heartbeat-ms", "0"}), Options::ParseResult::Error);
    EXPECT_EQ(parse({"--wait-ready-ms", "-1"}), Options::ParseResult::Error);
}

TEST_F(OptionsTest, UnknownLogLevelIsRejected)
{
    EXPECT_EQ(parse({"--log-level", "chatty"}), Options::ParseResult::Error);
    ASSERT_EQ(parse({"--log-level", "WARN"}), Options::ParseResult::Ok) << error_;
    EXPECT_EQ(host_opts::get_settings().log_level, "WARN");
}

TEST_F(OptionsTest, UnknownFlagIsRejected)
{
    EXPECT_EQ(parse({"--no-such-flag"}), Options::ParseResult::Error);
    EXPECT_FALSE(error_.empty());
}

TEST_F(OptionsTest, HelpAndVersion)
{
    EXPECT_EQ(parse({"--help"}), Options::ParseResult::Help);
    EXPECT_EQ(parse({"--version"}), Options::ParseResult::Version);
}
