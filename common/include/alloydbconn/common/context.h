/**
 * @file context.h
 * @brief Cancellable, deadline-bound execution context
 *
 * A Context carries a cancellation signal and an optional deadline across
 * threads. Children derived from a parent are canceled with it and never
 * outlive its deadline.
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_CONTEXT_H
#define ALLOYDBCONN_CONTEXT_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace alloydbconn {

enum class ContextState {
    Active,
    Canceled,
    DeadlineExceeded
};

/**
 * @brief Error reported for a finished context
 *
 * what() is "context canceled" or "context deadline exceeded".
 */
class ContextError : public std::runtime_error {
public:
    explicit ContextError(ContextState state);

    ContextState state() const noexcept { return state_; }

private:
    ContextState state_;
};

class Context : public std::enable_shared_from_this<Context> {
public:
    using Clock = std::chrono::steady_clock;
    using Callback = std::function<void()>;

    /**
     * @brief Keeps an AfterDone() callback registered until destroyed
     */
    class Registration {
    public:
        Registration() = default;
        Registration(std::weak_ptr<Context> ctx, uint64_t id);
        ~Registration();

        Registration(Registration&& other) noexcept;
        Registration& operator=(Registration&& other) noexcept;
        Registration(const Registration&) = delete;
        Registration& operator=(const Registration&) = delete;

    private:
        void Reset();

        std::weak_ptr<Context> ctx_;
        uint64_t id_ = 0;
    };

    ~Context();

    Context(const Context&) = delete;
    Context& operator=(const Context&) = delete;

    /**
     * @brief Root context: never canceled, no deadline
     */
    static std::shared_ptr<Context> Background();

    /**
     * @brief Child canceled by Cancel() or by its parent
     */
    static std::shared_ptr<Context> WithCancel(const std::shared_ptr<Context>& parent);

    /**
     * @brief Child whose deadline is the earlier of @p deadline and the parent's
     */
    static std::shared_ptr<Context> WithDeadline(
        const std::shared_ptr<Context>& parent,
        Clock::time_point deadline
    );

    static std::shared_ptr<Context> WithTimeout(
        const std::shared_ptr<Context>& parent,
        Clock::duration timeout
    );

    /**
     * @brief Cancel this context and every descendant
     *
     * No-op on Background() and on contexts that are already done.
     */
    void Cancel();

    /**
     * @brief Current state; a passed deadline reports DeadlineExceeded
     */
    ContextState State() const;

    bool Done() const { return State() != ContextState::Active; }

    /**
     * @throws ContextError if the context is done
     */
    void ThrowIfDone() const;

    std::optional<Clock::time_point> Deadline() const { return deadline_; }

    /**
     * @brief Block until the context is done or @p until is reached
     * @return true if the context finished first
     */
    bool WaitUntil(Clock::time_point until) const;

    /**
     * @brief Run @p callback once when the context is canceled
     *
     * Runs immediately on the calling thread if the context is already done.
     * Deadline expiry alone does not trigger callbacks; waiters observe it
     * through Deadline().
     */
    Registration AfterDone(Callback callback);

private:
    Context(bool cancelable, std::optional<Clock::time_point> deadline,
            std::weak_ptr<Context> parent);

    static std::shared_ptr<Context> MakeChild(
        const std::shared_ptr<Context>& parent,
        std::optional<Clock::time_point> deadline
    );

    void CancelWith(ContextState state);
    void RemoveChild(const Context* child);
    void Unregister(uint64_t id);

    // Caller holds mu_
    ContextState StateLocked() const;

    const bool cancelable_;
    const std::optional<Clock::time_point> deadline_;
    const std::weak_ptr<Context> parent_;

    mutable std::mutex mu_;
    mutable std::condition_variable cv_;
    mutable ContextState state_ = ContextState::Active;
    uint64_t next_callback_id_ = 1;
    std::map<uint64_t, Callback> callbacks_;
    std::map<const Context*, std::weak_ptr<Context>> children_;
};

/**
 * @brief Cancels a context when leaving scope
 */
class ScopedCancel {
public:
    explicit ScopedCancel(std::shared_ptr<Context> ctx) : ctx_(std::move(ctx)) {}
    ~ScopedCancel() { ctx_->Cancel(); }

    ScopedCancel(const ScopedCancel&) = delete;
    ScopedCancel& operator=(const ScopedCancel&) = delete;

private:
    std::shared_ptr<Context> ctx_;
};

} // namespace alloydbconn

#endif // ALLOYDBCONN_CONTEXT_H
