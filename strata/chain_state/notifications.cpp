// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "notifications.hpp"

namespace strata::chain_state {

CanonStateNotifications::CanonStateNotifications(CanonStateSignal& signal, size_t capacity)
    : queue_{std::make_shared<ThreadSafeQueue<CanonStateNotificationPtr>>(capacity)} {
    connection_ = signal.connect([queue = queue_](CanonStateNotificationPtr notification) {
        queue->push(std::move(notification));
    });
}

std::optional<CanonStateNotificationPtr> CanonStateNotifications::try_next() {
    return queue_->try_pop();
}

CanonStateNotificationPtr CanonStateNotifications::next() {
    return queue_->wait_and_pop();
}

std::optional<CanonStateNotificationPtr> CanonStateNotifications::next_for(std::chrono::milliseconds timeout) {
    return queue_->timed_wait_and_pop(timeout);
}

}  // namespace strata::chain_state
