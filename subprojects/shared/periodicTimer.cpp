#include "periodicTimer.hpp"
#include "processUtils.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

PeriodicTimer::PeriodicTimer(std::string name, std::chrono::milliseconds interval, Callback callback,
                             std::shared_ptr<Logger> logger)
    : name_(std::move(name)), interval_(interval), callback_(std::move(callback)), logger_(std::move(logger)) {
    if (interval_.count() <= 0) {
        throw std::invalid_argument("PeriodicTimer '" + name_ + "': interval must be positive");
    }
    if (!callback_) {
        throw std::invalid_argument("PeriodicTimer '" + name_ + "': callback cannot be empty");
    }
}

PeriodicTimer::~PeriodicTimer() {
    alive_->store(false);
    cancel();
    if (thread_.joinable()) {
        // Destroyed from its own callback: the loop sees alive_ cleared and returns.
        thread_.detach();
    }
}

void PeriodicTimer::start() {
    if (thread_.joinable() && running_.load()) return;
    if (thread_.joinable()) thread_.join();
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancel_requested_ = false;
    }
    running_ = true;
    thread_ = std::thread([this, alive = alive_, callback = callback_] { run_loop(alive, callback); });
}

void PeriodicTimer::cancel() {
    {
        std::lock_guard<std::mutex> lk(mutex_);
        cancel_requested_ = true;
    }
    cv_.notify_all();
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
    }
    running_ = false;
}

void PeriodicTimer::run_loop(std::shared_ptr<std::atomic<bool>> alive, Callback callback) {
    ProcessUtils::set_current_thread_name(name_);
    auto next = std::chrono::steady_clock::now() + interval_;
    while (true) {
        {
            std::unique_lock<std::mutex> lk(mutex_);
            if (cv_.wait_until(lk, next, [this] { return cancel_requested_; })) break;
        }
        std::optional<std::string> failure;
        try {
            callback();
        } catch (const std::exception& e) {
            failure = e.what();
        }
        if (!alive->load()) return;
        if (failure && logger_) logger_->error("PeriodicTimer '" + name_ + "': callback threw: " + *failure);
        ticks_.fetch_add(1);
        next += interval_;
        const auto now = std::chrono::steady_clock::now();
        if (next < now) next = now + interval_;
    }
    running_ = false;
}
