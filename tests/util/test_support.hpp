#pragma once

// Shared helpers for the hostbus unit tests: a capturing logger, a scratch
// directory removed on scope exit, and a polling wait for asynchronous state.

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <memory>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>

#include "logger.hpp"

namespace hostbus::test
{

/// Logger writing into a VectorSink at debug level; the sink is returned through `sink_out`.
inline std::shared_ptr<Logger> make_logger(std::shared_ptr<VectorSink>* sink_out = nullptr)
{
    auto logger = std::make_shared<Logger>("test");
    auto sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);
    if (sink_out) *sink_out = sink;
    return logger;
}

class TempDir
{
   public:
    TempDir()
    {
        std::string pattern = (std::filesystem::temp_directory_path() / "hostbus_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr)
        {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }
    ~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

   private:
    std::filesystem::path path_;
};

/// Poll `pred` every 10 ms until it holds or `timeout` elapses.
inline bool wait_until(const std::function<bool()>& pred,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(5000))
{
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}   // namespace hostbus::test
