// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <chrono>
#include <mutex>
#include <optional>

#include <strata/core/types/block.hpp>
#include <strata/core/types/block_id.hpp>

namespace strata::chain_state {

//! \brief Fork-choice pointers and the timestamps of the last consensus-layer signals
//! \details Thread-safe: every accessor takes the internal mutex
class ChainInfoTracker {
  public:
    using Clock = std::chrono::steady_clock;

    explicit ChainInfoTracker(SealedHeader head,
                              std::optional<SealedHeader> finalized = std::nullopt,
                              std::optional<SealedHeader> safe = std::nullopt);

    ChainInfo chain_info() const;

    void set_canonical_head(SealedHeader header);
    void set_safe(SealedHeader header);
    void set_finalized(SealedHeader header);

    SealedHeader canonical_head() const;
    BlockNum canonical_block_number() const;
    std::optional<SealedHeader> safe_header() const;
    std::optional<SealedHeader> finalized_header() const;
    std::optional<BlockNumHash> safe_num_hash() const;
    std::optional<BlockNumHash> finalized_num_hash() const;

    void on_forkchoice_update_received();
    std::optional<Clock::time_point> last_forkchoice_update_received_at() const;

    void on_transition_configuration_exchanged();
    std::optional<Clock::time_point> last_transition_configuration_exchanged_at() const;

  private:
    mutable std::mutex mutex_;
    SealedHeader canonical_head_;
    std::optional<SealedHeader> safe_block_;
    std::optional<SealedHeader> finalized_block_;
    std::optional<Clock::time_point> last_forkchoice_update_;
    std::optional<Clock::time_point> last_transition_configuration_exchange_;
};

}  // namespace strata::chain_state
