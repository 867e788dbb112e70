// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "chain_info_tracker.hpp"

#include <utility>

#include <strata/infra/common/log.hpp>

namespace strata::chain_state {

static std::optional<BlockNumHash> to_num_hash(const std::optional<SealedHeader>& header) {
    if (!header) return std::nullopt;
    return BlockNumHash{header->number(), header->hash};
}

ChainInfoTracker::ChainInfoTracker(SealedHeader head, std::optional<SealedHeader> finalized,
                                   std::optional<SealedHeader> safe)
    : canonical_head_{std::move(head)}, safe_block_{std::move(safe)}, finalized_block_{std::move(finalized)} {}

ChainInfo ChainInfoTracker::chain_info() const {
    std::scoped_lock lock{mutex_};
    return {.best_hash = canonical_head_.hash, .best_number = canonical_head_.number()};
}

void ChainInfoTracker::set_canonical_head(SealedHeader header) {
    STRATA_TRACE_M("ChainInfoTracker: canonical head", {"number", std::to_string(header.number())});
    std::scoped_lock lock{mutex_};
    canonical_head_ = std::move(header);
}

void ChainInfoTracker::set_safe(SealedHeader header) {
    STRATA_TRACE_M("ChainInfoTracker: safe block", {"number", std::to_string(header.number())});
    std::scoped_lock lock{mutex_};
    safe_block_ = std::move(header);
}

void ChainInfoTracker::set_finalized(SealedHeader header) {
    STRATA_TRACE_M("ChainInfoTracker: finalized block", {"number", std::to_string(header.number())});
    std::scoped_lock lock{mutex_};
    finalized_block_ = std::move(header);
}

SealedHeader ChainInfoTracker::canonical_head() const {
    std::scoped_lock lock{mutex_};
    return canonical_head_;
}

BlockNum ChainInfoTracker::canonical_block_number() const {
    std::scoped_lock lock{mutex_};
    return canonical_head_.number();
}

std::optional<SealedHeader> ChainInfoTracker::safe_header() const {
    std::scoped_lock lock{mutex_};
    return safe_block_;
}

std::optional<SealedHeader> ChainInfoTracker::finalized_header() const {
    std::scoped_lock lock{mutex_};
    return finalized_block_;
}

std::optional<BlockNumHash> ChainInfoTracker::safe_num_hash() const {
    std::scoped_lock lock{mutex_};
    return to_num_hash(safe_block_);
}

std::optional<BlockNumHash> ChainInfoTracker::finalized_num_hash() const {
    std::scoped_lock lock{mutex_};
    return to_num_hash(finalized_block_);
}

void ChainInfoTracker::on_forkchoice_update_received() {
    std::scoped_lock lock{mutex_};
    last_forkchoice_update_ = Clock::now();
}

std::optional<ChainInfoTracker::Clock::time_point> ChainInfoTracker::last_forkchoice_update_received_at() const {
    std::scoped_lock lock{mutex_};
    return last_forkchoice_update_;
}

void ChainInfoTracker::on_transition_configuration_exchanged() {
    std::scoped_lock lock{mutex_};
    last_transition_configuration_exchange_ = Clock::now();
}

std::optional<ChainInfoTracker::Clock::time_point> ChainInfoTracker::last_transition_configuration_exchanged_at() const {
    std::scoped_lock lock{mutex_};
    return last_transition_configuration_exchange_;
}

}  // namespace strata::chain_state
