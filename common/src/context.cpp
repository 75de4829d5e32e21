/**
 * @file context.cpp
 * @brief Cancellable, deadline-bound execution context
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#include "alloydbconn/common/context.h"
#include <utility>

namespace alloydbconn {

namespace {

const char* DescribeState(ContextState state) {
    switch (state) {
        case ContextState::Canceled:
            return "context canceled";
        case ContextState::DeadlineExceeded:
            return "context deadline exceeded";
        case ContextState::Active:
            break;
    }
    return "context active";
}

} // namespace

ContextError::ContextError(ContextState state)
    : std::runtime_error(DescribeState(state)), state_(state) {}

// ============================================================================
// Registration
// ============================================================================

Context::Registration::Registration(std::weak_ptr<Context> ctx, uint64_t id)
    : ctx_(std::move(ctx)), id_(id) {}

Context::Registration::~Registration() {
    Reset();
}

Context::Registration::Registration(Registration&& other) noexcept
    : ctx_(std::move(other.ctx_)), id_(other.id_) {
    other.id_ = 0;
}

Context::Registration& Context::Registration::operator=(Registration&& other) noexcept {
    if (this != &other) {
        Reset();
        ctx_ = std::move(other.ctx_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void Context::Registration::Reset() {
    if (id_ == 0) {
        return;
    }
    if (auto ctx = ctx_.lock()) {
        ctx->Unregister(id_);
    }
    ctx_.reset();
    id_ = 0;
}

// ============================================================================
// Context
// ============================================================================

Context::Context(bool cancelable, std::optional<Clock::time_point> deadline,
                 std::weak_ptr<Context> parent)
    : cancelable_(cancelable), deadline_(deadline), parent_(std::move(parent)) {}

Context::~Context() {
    if (auto parent = parent_.lock()) {
        parent->RemoveChild(this);
    }
}

std::shared_ptr<Context> Context::Background() {
    static const std::shared_ptr<Context> background(
        new Context(false, std::nullopt, std::weak_ptr<Context>()));
    return background;
}

std::shared_ptr<Context> Context::WithCancel(const std::shared_ptr<Context>& parent) {
    return MakeChild(parent, parent->deadline_);
}

std::shared_ptr<Context> Context::WithDeadline(
    const std::shared_ptr<Context>& parent,
    Clock::time_point deadline
) {
    if (parent->deadline_ && *parent->deadline_ < deadline) {
        deadline = *parent->deadline_;
    }
    return MakeChild(parent, deadline);
}

std::shared_ptr<Context> Context::WithTimeout(
    const std::shared_ptr<Context>& parent,
    Clock::duration timeout
) {
    return WithDeadline(parent, Clock::now() + timeout);
}

std::shared_ptr<Context> Context::MakeChild(
    const std::shared_ptr<Context>& parent,
    std::optional<Clock::time_point> deadline
) {
    std::shared_ptr<Context> child(new Context(true, deadline, parent));

    // A parent that can never be canceled has nothing to propagate
    if (!parent->cancelable_) {
        return child;
    }

    ContextState parent_state;
    {
        std::lock_guard<std::mutex> lock(parent->mu_);
        parent_state = parent->state_;
        if (parent_state == ContextState::Active) {
            parent->children_[child.get()] = child;
        }
    }
    if (parent_state != ContextState::Active) {
        child->CancelWith(parent_state);
    }
    return child;
}

void Context::Cancel() {
    if (!cancelable_) {
        return;
    }
    CancelWith(ContextState::Canceled);
}

void Context::CancelWith(ContextState state) {
    std::map<uint64_t, Callback> callbacks;
    std::map<const Context*, std::weak_ptr<Context>> children;
    ContextState final_state;
    {
        std::lock_guard<std::mutex> lock(mu_);
        // A context that already finished keeps its first state
        if (StateLocked() == ContextState::Active) {
            state_ = state;
        }
        final_state = state_;
        callbacks.swap(callbacks_);
        children.swap(children_);
    }
    cv_.notify_all();

    for (auto& entry : callbacks) {
        entry.second();
    }
    for (auto& entry : children) {
        if (auto child = entry.second.lock()) {
            child->CancelWith(final_state);
        }
    }

    if (auto parent = parent_.lock()) {
        parent->RemoveChild(this);
    }
}

void Context::RemoveChild(const Context* child) {
    std::lock_guard<std::mutex> lock(mu_);
    children_.erase(child);
}

void Context::Unregister(uint64_t id) {
    std::lock_guard<std::mutex> lock(mu_);
    callbacks_.erase(id);
}

ContextState Context::StateLocked() const {
    if (state_ == ContextState::Active && deadline_ && Clock::now() >= *deadline_) {
        state_ = ContextState::DeadlineExceeded;
    }
    return state_;
}

ContextState Context::State() const {
    std::lock_guard<std::mutex> lock(mu_);
    return StateLocked();
}

void Context::ThrowIfDone() const {
    ContextState state = State();
    if (state != ContextState::Active) {
        throw ContextError(state);
    }
}

bool Context::WaitUntil(Clock::time_point until) const {
    std::unique_lock<std::mutex> lock(mu_);
    Clock::time_point limit = until;
    if (deadline_ && *deadline_ < limit) {
        limit = *deadline_;
    }
    cv_.wait_until(lock, limit, [this] { return state_ != ContextState::Active; });
    return StateLocked() != ContextState::Active;
}

Context::Registration Context::AfterDone(Callback callback) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lock(mu_);
        if (state_ == ContextState::Active) {
            id = next_callback_id_++;
            callbacks_.emplace(id, std::move(callback));
        }
    }
    if (id == 0) {
        callback();
        return Registration();
    }
    return Registration(weak_from_this(), id);
}

} // namespace alloydbconn
