// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "in_memory_chain.hpp"

#include <utility>

#include <strata/core/common/assert.hpp>

namespace strata::chain_state {

InMemoryChain::InMemoryChain(FlatHashMap<Hash, BlockStatePtr> blocks, std::optional<Hash> tip_hash, BlockStatePtr pending)
    : pending_{std::move(pending)} {
    if (!tip_hash) return;

    auto it{blocks.find(*tip_hash)};
    while (it != blocks.end()) {
        const BlockStatePtr& state{it->second};
        const auto [_, inserted] = numbers_.emplace(state->number(), state->hash());
        STRATA_ASSERT(inserted);
        blocks_.emplace(state->hash(), state);
        if (state->number() == 0) break;
        const auto next{blocks.find(state->parent_hash())};
        if (next != blocks.end()) {
            STRATA_ASSERT(next->second->number() + 1 == state->number());
        }
        it = next;
    }
}

BlockStatePtr InMemoryChain::state_by_hash(const Hash& hash) const {
    const auto it{blocks_.find(hash)};
    return it != blocks_.end() ? it->second : nullptr;
}

BlockStatePtr InMemoryChain::state_by_number(BlockNum block_num) const {
    const auto it{numbers_.find(block_num)};
    return it != numbers_.end() ? state_by_hash(it->second) : nullptr;
}

BlockStatePtr InMemoryChain::tip() const {
    return numbers_.empty() ? nullptr : state_by_hash(numbers_.rbegin()->second);
}

BlockStatePtr InMemoryChain::lowest() const {
    return numbers_.empty() ? nullptr : state_by_hash(numbers_.begin()->second);
}

std::optional<BlockNum> InMemoryChain::tip_number() const {
    if (numbers_.empty()) return std::nullopt;
    return numbers_.rbegin()->first;
}

BlockNumHash InMemoryChain::anchor(const BlockState& state) const {
    BlockNumHash anchor{state.parent_num_hash()};
    while (const auto parent{state_by_hash(anchor.hash)}) {
        anchor = parent->parent_num_hash();
    }
    return anchor;
}

std::vector<BlockStatePtr> InMemoryChain::chain_from(const BlockStatePtr& state) const {
    std::vector<BlockStatePtr> chain;
    if (!state) return chain;
    chain.push_back(state);
    auto parents{parent_state_chain(*state)};
    chain.insert(chain.end(), parents.begin(), parents.end());
    return chain;
}

std::vector<BlockStatePtr> InMemoryChain::parent_state_chain(const BlockState& state) const {
    std::vector<BlockStatePtr> parents;
    auto parent{state.number() > 0 ? state_by_hash(state.parent_hash()) : nullptr};
    while (parent) {
        parents.push_back(parent);
        parent = parent->number() > 0 ? state_by_hash(parent->parent_hash()) : nullptr;
    }
    return parents;
}

std::vector<BlockStatePtr> InMemoryChain::canonical_chain() const {
    std::vector<BlockStatePtr> chain;
    chain.reserve(numbers_.size());
    for (auto it{numbers_.rbegin()}; it != numbers_.rend(); ++it) {
        chain.push_back(state_by_hash(it->second));
    }
    return chain;
}

std::vector<BlockStatePtr> InMemoryChain::ascending() const {
    std::vector<BlockStatePtr> chain;
    chain.reserve(numbers_.size());
    for (const auto& [_, hash] : numbers_) {
        chain.push_back(state_by_hash(hash));
    }
    return chain;
}

InMemoryChain InMemoryChain::with_pending(BlockStatePtr pending) const {
    InMemoryChain chain{*this};
    chain.pending_ = std::move(pending);
    return chain;
}

InMemoryChain InMemoryChain::without_pending() const {
    return with_pending(nullptr);
}

}  // namespace strata::chain_state
