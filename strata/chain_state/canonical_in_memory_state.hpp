// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <strata/chain_state/chain_info_tracker.hpp>
#include <strata/chain_state/in_memory_chain.hpp>
#include <strata/chain_state/memory_overlay_state.hpp>
#include <strata/chain_state/notifications.hpp>

namespace strata::chain_state {

//! \brief In-memory canonical overlay: executed blocks above the durable boundary plus fork-choice pointers
//! \details Each mutation publishes a new immutable InMemoryChain snapshot, swapped under a short lock. Single
//! lookups observe either the pre- or the post-mutation snapshot. Mutations are serialized among themselves.
class CanonicalInMemoryState {
  public:
    explicit CanonicalInMemoryState(SealedHeader head,
                                    std::optional<SealedHeader> finalized = std::nullopt,
                                    std::optional<SealedHeader> safe = std::nullopt);

    //! \brief Current snapshot of the in-memory blocks
    std::shared_ptr<const InMemoryChain> snapshot() const;

    BlockStatePtr state_by_hash(const Hash& hash) const;
    BlockStatePtr state_by_number(BlockNum block_num) const;

    //! \brief Highest in-memory canonical block, nullptr if none
    BlockStatePtr head_state() const;
    BlockStatePtr pending_state() const;

    std::optional<BlockHeader> pending_header() const;
    std::optional<SealedHeader> pending_sealed_header() const;
    std::optional<BlockNumHash> pending_block_num_hash() const;
    std::optional<SealedBlock> pending_block() const;
    std::optional<SealedBlockWithSenders> pending_block_with_senders() const;
    std::optional<std::pair<SealedBlock, std::vector<Receipt>>> pending_block_and_receipts() const;

    //! \brief In-memory canonical blocks from tip down to the lowest one
    std::vector<BlockStatePtr> canonical_chain() const;

    //! \brief Transaction with given hash in the in-memory canonical blocks, scanned from tip down
    std::optional<Transaction> transaction_by_hash(const Hash& tx_hash) const;
    std::optional<std::pair<Transaction, TransactionMeta>> transaction_by_hash_with_meta(const Hash& tx_hash) const;

    //! \brief State at the end of given in-memory block layered above the durable state at its anchor
    std::unique_ptr<MemoryOverlayStateView> state_provider(const InMemoryChain& chain,
                                                           const BlockStatePtr& state,
                                                           std::unique_ptr<StateView> historical) const;

    // Fork-choice tracking
    ChainInfo chain_info() const { return chain_info_.chain_info(); }
    BlockNum canonical_block_number() const { return chain_info_.canonical_block_number(); }
    SealedHeader canonical_head() const { return chain_info_.canonical_head(); }
    std::optional<SealedHeader> safe_header() const { return chain_info_.safe_header(); }
    std::optional<SealedHeader> finalized_header() const { return chain_info_.finalized_header(); }
    std::optional<BlockNumHash> safe_num_hash() const { return chain_info_.safe_num_hash(); }
    std::optional<BlockNumHash> finalized_num_hash() const { return chain_info_.finalized_num_hash(); }

    void set_canonical_head(SealedHeader header) { chain_info_.set_canonical_head(std::move(header)); }
    void set_safe(SealedHeader header) { chain_info_.set_safe(std::move(header)); }
    void set_finalized(SealedHeader header) { chain_info_.set_finalized(std::move(header)); }

    void on_forkchoice_update_received() { chain_info_.on_forkchoice_update_received(); }
    std::optional<ChainInfoTracker::Clock::time_point> last_received_update_timestamp() const {
        return chain_info_.last_forkchoice_update_received_at();
    }
    void on_transition_configuration_exchanged() { chain_info_.on_transition_configuration_exchanged(); }
    std::optional<ChainInfoTracker::Clock::time_point> last_exchanged_transition_configuration_timestamp() const {
        return chain_info_.last_transition_configuration_exchanged_at();
    }

    // Write transitions

    //! \brief Applies a commit or a reorg, clears the pending block, moves the canonical head to the new tip and
    //! publishes a CanonStateNotification
    //! \throws std::invalid_argument if the new blocks are not an ascending linked sequence attached to the
    //! remaining in-memory chain or to the durable boundary
    void update_chain(NewCanonicalChain chain);

    void set_pending_block(ExecutedBlock block);

    //! \brief Evicts blocks up to and including the persisted one, now readable from the durable store
    //! \remarks Nothing happens if the persisted block is not in memory, e.g. it was reorged out meanwhile
    void remove_persisted_blocks(BlockNumHash persisted);

    // Notifications
    //! \brief Subscription buffering the notifications of later write transitions
    //! \remarks Notifications are queued while the transition still holds the write lock, so only buffering
    //! subscriptions are connected to the signal
    CanonStateNotifications subscribe_canon_state(size_t capacity = CanonStateNotifications::kDefaultCapacity);

  private:
    void publish(std::shared_ptr<const InMemoryChain> chain);

    mutable std::mutex snapshot_mutex_;
    std::shared_ptr<const InMemoryChain> snapshot_;

    //! Serializes write transitions, so that each one reads the snapshot it replaces
    std::mutex write_mutex_;

    ChainInfoTracker chain_info_;
    CanonStateSignal canon_state_signal_;
};

}  // namespace strata::chain_state
