/**
 * \file coroIoContext.cpp
 * \brief Loop threads, pending operation processing and work guard mechanics.
 * \details Pending operations are taken in one batch (swap with a local vector) so the
 * try/resume pass runs outside the lock. Unfinished operations are put back afterwards.
 */
#include "coroIoContext.hpp"
#include "processUtils.hpp"

#include <numeric>
#include <string>

namespace transport {

CoroIoContext::CoroIoContext(std::chrono::milliseconds poll_interval) : poll_interval_(poll_interval) {
    for (auto& c : processed_by_category_) c.store(0);
}

CoroIoContext::~CoroIoContext() { stop(); }

void CoroIoContext::start(size_t threads) {
    if (threads == 0) threads = 1;
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) return;
    event_threads_.reserve(threads);
    for (size_t i = 0; i < threads; ++i) {
        event_threads_.emplace_back([this, i] {
            ProcessUtils::set_current_thread_name("hb-io-" + std::to_string(i));
            run(i);
        });
    }
    if (logger_) logger_->debug("CoroIoContext started with " + std::to_string(threads) + " thread(s)");
}

void CoroIoContext::stop() {
    if (!running_.exchange(false)) return;
    // Outstanding work no longer holds the loop once stop is explicit.
    outstanding_work_.store(0);
    pending_cv_.notify_all();
    for (auto& t : event_threads_) {
        if (t.joinable()) t.join();
    }
    event_threads_.clear();
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (!pending_ops_.empty() && logger_) {
            logger_->debug("CoroIoContext stopped with " + std::to_string(pending_ops_.size()) + " abandoned operation(s)");
        }
        pending_ops_.clear();
    }
    if (logger_) logger_->debug("CoroIoContext stopped: " + format_statistics());
}

bool CoroIoContext::is_running() const { return running_; }

void CoroIoContext::set_logger(std::shared_ptr<Logger> logger) { logger_ = std::move(logger); }
std::shared_ptr<Logger> CoroIoContext::get_logger() const { return logger_; }

void CoroIoContext::run(size_t thread_index) {
    while (running_ || outstanding_work_.load(std::memory_order_acquire) > 0) {
        try {
            process_pending_ops(thread_index);
        } catch (const std::exception& e) {
            if (logger_) logger_->error("Exception in event loop: " + std::string(e.what()));
        }
        std::unique_lock<std::mutex> lk(pending_mutex_);
        pending_cv_.wait_for(lk, poll_interval_, [this]() {
            return !running_ || !pending_ops_.empty();
        });
    }
}

void CoroIoContext::process_pending_ops(size_t /*thread_index*/) {
    std::vector<PendingOp> fetched;
    std::vector<PendingOp> requeue;
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        if (pending_ops_.empty()) return;
        fetched.swap(pending_ops_);
    }

    for (auto& op : fetched) {
        if (!running_) {
            requeue.push_back(std::move(op));
            continue;
        }
        bool completed = false;
        try {
            if (op.try_complete) completed = op.try_complete();
        } catch (const std::exception& e) {
            if (logger_) logger_->error(std::string("Error in try_complete: ") + e.what());
            completed = true;
        }
        if (!completed) {
            requeue.push_back(std::move(op));
            continue;
        }
        auto h = op.handle;
        if (h && !h.done()) {
            h.resume();
            processed_by_category_[static_cast<size_t>(op.category)].fetch_add(1, std::memory_order_relaxed);
        }
    }

    if (!requeue.empty()) {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        pending_ops_.reserve(pending_ops_.size() + requeue.size());
        for (auto& op : requeue) pending_ops_.push_back(std::move(op));
    }
}

void CoroIoContext::register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    register_pending(PendingOpCategory::Generic, std::move(try_complete), handle);
}

void CoroIoContext::register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle) {
    {
        std::lock_guard<std::mutex> lk(pending_mutex_);
        pending_ops_.push_back(PendingOp{std::move(try_complete), handle, category});
    }
    wake_();
}

size_t CoroIoContext::pending_count() const {
    std::lock_guard<std::mutex> lk(pending_mutex_);
    return pending_ops_.size();
}

size_t CoroIoContext::get_total_operations_processed() const {
    size_t total = 0;
    for (const auto& c : processed_by_category_) total += c.load(std::memory_order_relaxed);
    return total;
}

size_t CoroIoContext::get_operations_processed(PendingOpCategory category) const {
    const auto idx = static_cast<size_t>(category);
    if (idx >= category_count_) return 0;
    return processed_by_category_[idx].load(std::memory_order_relaxed);
}

std::string CoroIoContext::format_statistics() const {
    return "resumed total=" + std::to_string(get_total_operations_processed()) +
           " read=" + std::to_string(get_operations_processed(PendingOpCategory::Read)) +
           " header=" + std::to_string(get_operations_processed(PendingOpCategory::ReadHeader)) +
           " write=" + std::to_string(get_operations_processed(PendingOpCategory::Write));
}

// WorkGuard
CoroIoContext::WorkGuard::WorkGuard(std::shared_ptr<CoroIoContext> loop) : loop_(std::move(loop)) { increment_(); }
CoroIoContext::WorkGuard::WorkGuard(WorkGuard&& other) noexcept : loop_(std::move(other.loop_)), active_(other.active_) { other.active_ = false; }
CoroIoContext::WorkGuard& CoroIoContext::WorkGuard::operator=(WorkGuard&& other) noexcept {
    if (this != &other) {
        decrement_();
        loop_ = std::move(other.loop_);
        active_ = other.active_;
        other.active_ = false;
    }
    return *this;
}
CoroIoContext::WorkGuard::~WorkGuard() { decrement_(); }
void CoroIoContext::WorkGuard::increment_() {
    if (loop_ && active_) {
        loop_->outstanding_work_.fetch_add(1, std::memory_order_relaxed);
        loop_->wake_();
    }
}
void CoroIoContext::WorkGuard::decrement_() {
    if (loop_ && active_) {
        active_ = false;
        auto prev = loop_->outstanding_work_.load(std::memory_order_acquire);
        // stop() may already have zeroed the counter.
        while (prev > 0 && !loop_->outstanding_work_.compare_exchange_weak(prev, prev - 1, std::memory_order_acq_rel)) {
        }
        loop_->wake_();
    }
}

} // namespace transport
