/**
 * \file coroIoContext.hpp
 * \brief Coroutine-aware event loop that drives the bus's non-blocking socket I/O.
 * \details Pending operations register a non-blocking `try_complete()` functor with the
 * coroutine waiting on it. Loop threads repeatedly try the functors and resume the
 * coroutine once one reports completion. A `notify_one()` wakeup with a short timed wait
 * backs the polling so shutdown stays prompt. Each bus instance owns its own context.
 */
#pragma once

#include "logger.hpp"
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <coroutine>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace transport {

/** \defgroup coro_context I/O Context
 *  \ingroup coro_module
 *  \brief Event loop for coroutine scheduling and pending operation polling.
 */

/** \brief Event loop polling pending operations and resuming their coroutines.
 *  \ingroup coro_context
 */
class CoroIoContext : public std::enable_shared_from_this<CoroIoContext> {
public:
	explicit CoroIoContext(std::chrono::milliseconds poll_interval = std::chrono::milliseconds(5));
	~CoroIoContext();

	CoroIoContext(const CoroIoContext&) = delete;
	CoroIoContext& operator=(const CoroIoContext&) = delete;

	/** \brief Classification used for per-category completion counters. */
	enum class PendingOpCategory : uint8_t { Generic = 0, Read, ReadHeader, Write, Timer, Count };
	static constexpr size_t category_count_ = static_cast<size_t>(PendingOpCategory::Count);

	// --- Lifecycle ---
	/** \brief Start the loop with `threads` worker threads (minimum 1). */
	void start(size_t threads = 1);
	/** \brief Run the loop body on the calling thread until `stop()`. */
	void run(size_t thread_index = 0);
	/** \brief Request shutdown and join worker threads. Pending operations are abandoned. */
	void stop();
	bool is_running() const;

	void set_logger(std::shared_ptr<Logger> logger);
	std::shared_ptr<Logger> get_logger() const;

	// --- Pending operations ---
	/** \brief Register a pending operation; `handle` is resumed once `try_complete` returns true. */
	void register_pending(std::function<bool()> try_complete, std::coroutine_handle<> handle);
	void register_pending(PendingOpCategory category, std::function<bool()> try_complete, std::coroutine_handle<> handle);
	/** \brief Number of operations currently waiting for readiness. */
	size_t pending_count() const;

	// --- Work guard ---
	/** \brief RAII object keeping the loop alive while outstanding work exists. */
	class WorkGuard {
	public:
		explicit WorkGuard(std::shared_ptr<CoroIoContext> loop);
		WorkGuard(const WorkGuard&) = delete;
		WorkGuard& operator=(const WorkGuard&) = delete;
		WorkGuard(WorkGuard&& other) noexcept;
		WorkGuard& operator=(WorkGuard&& other) noexcept;
		~WorkGuard();
		bool active() const noexcept { return active_; }
	private:
		void increment_();
		void decrement_();
		std::shared_ptr<CoroIoContext> loop_;
		bool active_{true};
	};
	WorkGuard make_work_guard() { return WorkGuard(shared_from_this()); }

	// --- Statistics ---
	/** \brief Total coroutine resumptions across all loop threads. */
	size_t get_total_operations_processed() const;
	/** \brief Resumptions for one category. */
	size_t get_operations_processed(PendingOpCategory category) const;
	/** \brief One-line summary for shutdown logs. */
	std::string format_statistics() const;

private:
	void process_pending_ops(size_t thread_index);

	struct PendingOp {
		std::function<bool()> try_complete;
		std::coroutine_handle<> handle;
		PendingOpCategory category{PendingOpCategory::Generic};
	};
	std::vector<PendingOp> pending_ops_;
	mutable std::mutex pending_mutex_;
	std::condition_variable pending_cv_;
	void wake_() { pending_cv_.notify_one(); }

	std::atomic<bool> running_{false};
	std::vector<std::thread> event_threads_;
	std::shared_ptr<Logger> logger_;
	std::chrono::milliseconds poll_interval_;

	std::atomic<size_t> outstanding_work_{0};
	std::array<std::atomic<size_t>, category_count_> processed_by_category_{};
};

} // namespace transport
