/**
 * \file CoroTask.hpp
 * \brief Eager C++20 coroutine task used by bus sessions.
 * \details `Task<T>` starts running on creation (`initial_suspend = suspend_never`) and
 * parks at its final suspend point so the owner decides when the frame is destroyed.
 * An exception escaping the body is captured and can be inspected through
 * `failed()` / `rethrow_if_failed()` once the task is done.
 */
#pragma once
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

/**
 * \defgroup coro_module Coroutine I/O Module
 * \brief Event loop, task types, and socket adapter for coroutine-based non-blocking I/O.
 * \details Provides the building blocks for coroutine-style networking: `Task<T>` wrappers,
 * `CoroIoContext` event loop, and `CoroSocketAdapter` awaitables over a pluggable `IAsyncStream`.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Minimal coroutine task wrappers.
 */

/** \addtogroup coro_task
 *  @{ */

namespace coro_detail {

/** \brief Promise state shared by every `Task` flavour. */
struct PromiseBase {
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }
    void unhandled_exception() noexcept { error_ = std::current_exception(); }
    std::exception_ptr error_{};
};

/** \brief Move-only owner of a coroutine frame. */
template <typename Promise>
class TaskHandle {
public:
    explicit TaskHandle(std::coroutine_handle<Promise> handle) : h(handle) {}
    ~TaskHandle() { if (h) h.destroy(); }
    TaskHandle(TaskHandle&& other) noexcept : h(std::exchange(other.h, nullptr)) {}
    TaskHandle& operator=(TaskHandle&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = std::exchange(other.h, nullptr);
        }
        return *this;
    }
    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    /// True once the body has returned or thrown.
    bool done() const { return !h || h.done(); }
    /// True if the body finished by throwing.
    bool failed() const { return h && h.done() && h.promise().error_ != nullptr; }
    void rethrow_if_failed() const {
        if (failed()) std::rethrow_exception(h.promise().error_);
    }
    std::coroutine_handle<Promise> get_handle() const { return h; }

protected:
    std::coroutine_handle<Promise> h;
};

} // namespace coro_detail

template <typename T> struct TaskPromise_;

/** \brief Eager coroutine task producing a `T`. */
template <typename T = void>
struct Task : coro_detail::TaskHandle<TaskPromise_<T>> {
    using promise_type = TaskPromise_<T>;
    using coro_detail::TaskHandle<promise_type>::TaskHandle;

    /// Result of a finished task; rethrows a captured exception.
    T get_result() {
        this->rethrow_if_failed();
        return std::move(*this->h.promise().value_);
    }
};

template <typename T>
struct TaskPromise_ : coro_detail::PromiseBase {
    Task<T> get_return_object() { return Task<T>{std::coroutine_handle<TaskPromise_>::from_promise(*this)}; }
    void return_value(T value) { value_ = std::move(value); }
    std::optional<T> value_{};
};

template <>
struct TaskPromise_<void> : coro_detail::PromiseBase {
    Task<void> get_return_object();
    void return_void() noexcept {}
};

/** \brief `Task<void>` keeps the same lifetime rules without a result slot. */
template <>
struct Task<void> : coro_detail::TaskHandle<TaskPromise_<void>> {
    using promise_type = TaskPromise_<void>;
    using coro_detail::TaskHandle<promise_type>::TaskHandle;
};

inline Task<void> TaskPromise_<void>::get_return_object() {
    return Task<void>{std::coroutine_handle<TaskPromise_<void>>::from_promise(*this)};
}

/** @} */
