// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <optional>
#include <vector>

#include <strata/chain_state/block_state.hpp>
#include <strata/chain_state/executed_block.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/core/types/block_id.hpp>

namespace strata::chain_state {

using BlockStatePtr = std::shared_ptr<const BlockState>;

//! \brief Immutable snapshot of the in-memory canonical blocks above the durable boundary
//! \details Blocks are stored by hash and each one knows only its parent hash. The canonical number index is
//! derived by walking parents down from the tip, so every number in (anchor, tip] appears exactly once.
//! Every mutation builds a new snapshot: readers holding an old one keep a consistent view.
class InMemoryChain {
  public:
    InMemoryChain() = default;

    //! \brief Builds the canonical chain ending at tip_hash out of given blocks
    //! \details Blocks not reachable from the tip are discarded
    InMemoryChain(FlatHashMap<Hash, BlockStatePtr> blocks, std::optional<Hash> tip_hash, BlockStatePtr pending);

    bool empty() const { return numbers_.empty(); }
    size_t size() const { return numbers_.size(); }

    BlockStatePtr state_by_hash(const Hash& hash) const;
    BlockStatePtr state_by_number(BlockNum block_num) const;

    //! \brief Highest canonical block
    BlockStatePtr tip() const;
    //! \brief Lowest canonical block, the one right above the anchor
    BlockStatePtr lowest() const;
    BlockStatePtr pending() const { return pending_; }

    std::optional<BlockNum> tip_number() const;

    //! \brief Last durable block the given block descends from
    //! \details Walks parents of state inside this snapshot until the hash leaves it
    BlockNumHash anchor(const BlockState& state) const;

    //! \brief The given block followed by its in-memory ancestors, newest first
    std::vector<BlockStatePtr> chain_from(const BlockStatePtr& state) const;

    //! \brief In-memory ancestors of the given block, newest first, excluding the block itself
    std::vector<BlockStatePtr> parent_state_chain(const BlockState& state) const;

    //! \brief All canonical blocks from tip down to the lowest one
    std::vector<BlockStatePtr> canonical_chain() const;

    //! \brief Canonical blocks in ascending order
    std::vector<BlockStatePtr> ascending() const;

    const FlatHashMap<Hash, BlockStatePtr>& blocks() const { return blocks_; }

    // Building blocks for new snapshots
    InMemoryChain with_pending(BlockStatePtr pending) const;
    InMemoryChain without_pending() const;

  private:
    FlatHashMap<Hash, BlockStatePtr> blocks_;
    std::map<BlockNum, Hash> numbers_;
    BlockStatePtr pending_;
};

}  // namespace strata::chain_state
