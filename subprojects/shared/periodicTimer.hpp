/**
 * \file periodicTimer.hpp
 * \brief Owned, cancellable repeating timer running a callback on its own thread.
 * \details The first tick fires one interval after `start()`. `cancel()` wakes the
 * sleeping thread and joins it, so once it returns no further callback runs.
 * The callback may destroy its own timer; the thread then exits without touching it.
 */
#pragma once

#include "logger.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

class PeriodicTimer {
public:
    using Callback = std::function<void()>;

    PeriodicTimer(std::string name, std::chrono::milliseconds interval, Callback callback,
                  std::shared_ptr<Logger> logger = nullptr);
    ~PeriodicTimer();

    PeriodicTimer(const PeriodicTimer&) = delete;
    PeriodicTimer& operator=(const PeriodicTimer&) = delete;

    /** \brief Launch the timer thread. No-op if already running. */
    void start();

    /** \brief Stop ticking and join the thread.
     *  \details Called from inside the callback it only flags the loop to exit; the
     *  join then happens on the next `cancel()` or in the destructor.
     */
    void cancel();

    bool is_running() const { return running_.load(); }
    std::chrono::milliseconds interval() const { return interval_; }
    /// Number of completed callback invocations.
    uint64_t ticks() const { return ticks_.load(); }

private:
    void run_loop(std::shared_ptr<std::atomic<bool>> alive, Callback callback);

    std::string name_;
    std::chrono::milliseconds interval_;
    Callback callback_;
    std::shared_ptr<Logger> logger_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> ticks_{0};
    std::mutex mutex_;
    std::condition_variable cv_;
    bool cancel_requested_{false};
    std::shared_ptr<std::atomic<bool>> alive_{std::make_shared<std::atomic<bool>>(true)};
    std::thread thread_;
};
