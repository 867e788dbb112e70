// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include <boost/signals2.hpp>

#include <strata/chain_state/executed_block.hpp>
#include <strata/infra/concurrency/thread_safe_queue.hpp>

namespace strata::chain_state {

//! \brief Canonical chain transition applied to the in-memory overlay
struct NewCanonicalChain {
    enum class Kind : uint8_t {
        kCommit,  // new blocks extend the current tip
        kReorg,   // old blocks are replaced by new ones
    };

    Kind kind{Kind::kCommit};
    //! Blocks becoming canonical, ascending
    std::vector<ExecutedBlock> new_blocks;
    //! Blocks leaving the canonical chain, ascending (reorg only)
    std::vector<ExecutedBlock> old_blocks;

    static NewCanonicalChain commit(std::vector<ExecutedBlock> new_blocks) {
        return {Kind::kCommit, std::move(new_blocks), {}};
    }
    static NewCanonicalChain reorg(std::vector<ExecutedBlock> new_blocks, std::vector<ExecutedBlock> old_blocks) {
        return {Kind::kReorg, std::move(new_blocks), std::move(old_blocks)};
    }

    const ExecutedBlock& tip() const { return new_blocks.back(); }
};

//! \brief Event published to downstream consumers each time the canonical chain changes
struct CanonStateNotification {
    using Kind = NewCanonicalChain::Kind;

    Kind kind{Kind::kCommit};
    std::vector<ExecutedBlock> committed;
    std::vector<ExecutedBlock> reverted;

    bool is_reorg() const { return kind == Kind::kReorg; }
    const ExecutedBlock& tip() const { return committed.back(); }
};

using CanonStateNotificationPtr = std::shared_ptr<const CanonStateNotification>;
using CanonStateSignal = boost::signals2::signal<void(CanonStateNotificationPtr)>;

//! \brief Subscription yielding canonical state notifications in publication order
//! \details Notifications published after construction are buffered until consumed, up to a capacity. A subscriber
//! falling further behind loses the oldest buffered notifications, counted by lagged(). Destroying the subscription
//! disconnects it.
class CanonStateNotifications {
  public:
    static constexpr size_t kDefaultCapacity{256};

    explicit CanonStateNotifications(CanonStateSignal& signal, size_t capacity = kDefaultCapacity);

    CanonStateNotifications(CanonStateNotifications&&) = default;
    CanonStateNotifications& operator=(CanonStateNotifications&&) = default;

    //! \brief Next buffered notification, without waiting
    std::optional<CanonStateNotificationPtr> try_next();

    //! \brief Next notification, waiting until one is published
    CanonStateNotificationPtr next();

    //! \brief Next notification, waiting at most the given timeout
    std::optional<CanonStateNotificationPtr> next_for(std::chrono::milliseconds timeout);

    bool connected() const { return connection_.connected(); }

    //! \brief Number of notifications dropped because this subscriber did not keep up
    size_t lagged() const { return queue_->dropped(); }

  private:
    std::shared_ptr<ThreadSafeQueue<CanonStateNotificationPtr>> queue_;
    boost::signals2::scoped_connection connection_;
};

}  // namespace strata::chain_state
