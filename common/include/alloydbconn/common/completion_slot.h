/**
 * @file completion_slot.h
 * @brief Single-slot channel for handing one result between threads
 *
 * Copyright 2025 alloydbconn contributors
 * SPDX-License-Identifier: Apache-2.0
 */

#ifndef ALLOYDBCONN_COMPLETION_SLOT_H
#define ALLOYDBCONN_COMPLETION_SLOT_H

#include "alloydbconn/common/context.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <utility>

namespace alloydbconn {

/**
 * @brief Buffered channel of capacity one
 *
 * The producer sends exactly once and never blocks, so it may finish after
 * the consumer has given up. Copies share the same slot.
 *
 * @tparam T Result type (movable)
 */
template <typename T>
class CompletionSlot {
public:
    CompletionSlot() : state_(std::make_shared<State>()) {}

    /**
     * @brief Store the result and wake the receiver
     * @throws std::logic_error on a second send
     */
    void Send(T value) {
        {
            std::lock_guard<std::mutex> lock(state_->mu);
            if (state_->sent) {
                throw std::logic_error("CompletionSlot: result already sent");
            }
            state_->sent = true;
            state_->value.emplace(std::move(value));
        }
        state_->cv.notify_all();
    }

    /**
     * @brief Wait for the result or for @p ctx to finish, whichever is first
     *
     * A result that is already available wins over a finished context.
     *
     * @return The result, or std::nullopt if the context finished first or
     *         the result was already taken
     */
    std::optional<T> Receive(Context& ctx) {
        std::shared_ptr<State> state = state_;
        Context::Registration wake = ctx.AfterDone([state] {
            std::lock_guard<std::mutex> lock(state->mu);
            state->cv.notify_all();
        });

        std::unique_lock<std::mutex> lock(state->mu);
        while (!state->value) {
            if (state->sent || ctx.Done()) {
                return std::nullopt;
            }
            if (auto deadline = ctx.Deadline()) {
                state->cv.wait_until(lock, *deadline);
            } else {
                state->cv.wait(lock);
            }
        }
        std::optional<T> result(std::move(state->value));
        state->value.reset();
        return result;
    }

private:
    struct State {
        std::mutex mu;
        std::condition_variable cv;
        bool sent = false;
        std::optional<T> value;
    };

    std::shared_ptr<State> state_;
};

} // namespace alloydbconn

#endif // ALLOYDBCONN_COMPLETION_SLOT_H
