// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "canonical_in_memory_state.hpp"

#include <string>

#include <strata/core/common/util.hpp>
#include <strata/infra/common/ensure.hpp>
#include <strata/infra/common/log.hpp>

namespace strata::chain_state {

//! Checks that blocks are ascending and each one is the parent of the next
static void ensure_linked(const std::vector<ExecutedBlock>& blocks, const char* what) {
    for (size_t i{1}; i < blocks.size(); ++i) {
        const ExecutedBlock& parent{blocks[i - 1]};
        const ExecutedBlock& child{blocks[i]};
        ensure_pre_condition(child.number() == parent.number() + 1 &&
                                 child.sealed_header().parent_hash() == parent.hash(),
                             [&]() {
                                 return std::string{what} + " block " + std::to_string(child.number()) +
                                        " does not extend block " + std::to_string(parent.number()) + " " +
                                        to_hex(parent.hash());
                             });
    }
}

CanonicalInMemoryState::CanonicalInMemoryState(SealedHeader head, std::optional<SealedHeader> finalized,
                                               std::optional<SealedHeader> safe)
    : snapshot_{std::make_shared<const InMemoryChain>()},
      chain_info_{std::move(head), std::move(finalized), std::move(safe)} {}

std::shared_ptr<const InMemoryChain> CanonicalInMemoryState::snapshot() const {
    std::scoped_lock lock{snapshot_mutex_};
    return snapshot_;
}

void CanonicalInMemoryState::publish(std::shared_ptr<const InMemoryChain> chain) {
    std::scoped_lock lock{snapshot_mutex_};
    snapshot_ = std::move(chain);
}

BlockStatePtr CanonicalInMemoryState::state_by_hash(const Hash& hash) const {
    return snapshot()->state_by_hash(hash);
}

BlockStatePtr CanonicalInMemoryState::state_by_number(BlockNum block_num) const {
    return snapshot()->state_by_number(block_num);
}

BlockStatePtr CanonicalInMemoryState::head_state() const {
    return snapshot()->tip();
}

BlockStatePtr CanonicalInMemoryState::pending_state() const {
    return snapshot()->pending();
}

std::optional<BlockHeader> CanonicalInMemoryState::pending_header() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return pending->header();
}

std::optional<SealedHeader> CanonicalInMemoryState::pending_sealed_header() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return pending->sealed_header();
}

std::optional<BlockNumHash> CanonicalInMemoryState::pending_block_num_hash() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return pending->num_hash();
}

std::optional<SealedBlock> CanonicalInMemoryState::pending_block() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return pending->sealed_block();
}

std::optional<SealedBlockWithSenders> CanonicalInMemoryState::pending_block_with_senders() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return pending->block().sealed_block_with_senders();
}

std::optional<std::pair<SealedBlock, std::vector<Receipt>>> CanonicalInMemoryState::pending_block_and_receipts() const {
    const auto pending{pending_state()};
    if (!pending) return std::nullopt;
    return std::make_pair(pending->sealed_block(), pending->receipts());
}

std::vector<BlockStatePtr> CanonicalInMemoryState::canonical_chain() const {
    return snapshot()->canonical_chain();
}

std::optional<Transaction> CanonicalInMemoryState::transaction_by_hash(const Hash& tx_hash) const {
    for (const auto& state : canonical_chain()) {
        if (auto found{state->transaction_by_hash(tx_hash)}) {
            return std::move(found->first);
        }
    }
    return std::nullopt;
}

std::optional<std::pair<Transaction, TransactionMeta>> CanonicalInMemoryState::transaction_by_hash_with_meta(
    const Hash& tx_hash) const {
    for (const auto& state : canonical_chain()) {
        if (auto found{state->transaction_by_hash(tx_hash)}) {
            return std::make_pair(std::move(found->first), state->transaction_meta(found->second));
        }
    }
    return std::nullopt;
}

std::unique_ptr<MemoryOverlayStateView> CanonicalInMemoryState::state_provider(
    const InMemoryChain& chain, const BlockStatePtr& state, std::unique_ptr<StateView> historical) const {
    return std::make_unique<MemoryOverlayStateView>(chain.chain_from(state), std::move(historical));
}

void CanonicalInMemoryState::update_chain(NewCanonicalChain chain) {
    const bool is_reorg{chain.kind == NewCanonicalChain::Kind::kReorg};
    ensure_pre_condition(!chain.new_blocks.empty(), []() { return std::string{"canonical update without new blocks"}; });
    ensure_linked(chain.new_blocks, "new");
    ensure_linked(chain.old_blocks, "old");

    std::scoped_lock write_lock{write_mutex_};
    const auto current{snapshot()};

    FlatHashMap<Hash, BlockStatePtr> blocks{current->blocks()};
    for (const auto& old_block : chain.old_blocks) {
        blocks.erase(old_block.hash());
    }

    const ExecutedBlock& first{chain.new_blocks.front()};
    const auto parent{blocks.find(first.sealed_header().parent_hash())};
    if (parent != blocks.end()) {
        ensure_pre_condition(parent->second->number() + 1 == first.number(), [&]() {
            return "block " + std::to_string(first.number()) + " attached to in-memory parent " +
                   std::to_string(parent->second->number());
        });
        if (!is_reorg) {
            const auto tip{current->tip()};
            ensure_pre_condition(tip && tip->hash() == parent->second->hash(), [&]() {
                return "commit of block " + std::to_string(first.number()) + " does not extend the in-memory tip";
            });
        }
    } else {
        // No in-memory parent: the new blocks must start right above the durable boundary
        ensure_pre_condition(is_reorg || blocks.empty(), [&]() {
            return "commit of block " + std::to_string(first.number()) + " does not extend the in-memory tip";
        });
        for (const auto& [_, state] : blocks) {
            ensure_pre_condition(state->number() >= first.number(), [&]() {
                return "block " + std::to_string(first.number()) + " " + to_hex(first.hash()) +
                       " has unknown parent while block " + std::to_string(state->number()) + " is in memory";
            });
        }
    }

    for (const auto& new_block : chain.new_blocks) {
        blocks.insert_or_assign(new_block.hash(), std::make_shared<const BlockState>(new_block));
    }

    const ExecutedBlock& tip{chain.tip()};
    auto updated{std::make_shared<const InMemoryChain>(std::move(blocks), tip.hash(), /*pending=*/nullptr)};
    STRATA_DEBUG_M("CanonicalInMemoryState: chain updated",
                   {"kind", is_reorg ? "reorg" : "commit",
                    "new", std::to_string(chain.new_blocks.size()),
                    "old", std::to_string(chain.old_blocks.size()),
                    "tip", std::to_string(tip.number())});
    publish(std::move(updated));
    chain_info_.set_canonical_head(tip.sealed_header());

    auto notification{std::make_shared<CanonStateNotification>()};
    notification->kind = chain.kind;
    notification->committed = std::move(chain.new_blocks);
    notification->reverted = std::move(chain.old_blocks);
    canon_state_signal_(std::move(notification));
}

void CanonicalInMemoryState::set_pending_block(ExecutedBlock block) {
    std::scoped_lock write_lock{write_mutex_};
    STRATA_TRACE_M("CanonicalInMemoryState: pending block", {"number", std::to_string(block.number())});
    const auto current{snapshot()};
    publish(std::make_shared<const InMemoryChain>(current->with_pending(std::make_shared<const BlockState>(std::move(block)))));
}

void CanonicalInMemoryState::remove_persisted_blocks(BlockNumHash persisted) {
    std::scoped_lock write_lock{write_mutex_};
    const auto current{snapshot()};
    if (!current->state_by_hash(persisted.hash)) {
        STRATA_DEBUG_M("CanonicalInMemoryState: persisted block not in memory",
                       {"number", std::to_string(persisted.number), "hash", to_hex(persisted.hash)});
        return;
    }

    FlatHashMap<Hash, BlockStatePtr> blocks;
    for (const auto& [hash, state] : current->blocks()) {
        if (state->number() > persisted.number) {
            blocks.emplace(hash, state);
        }
    }
    BlockStatePtr pending{current->pending()};
    if (pending && pending->number() <= persisted.number) {
        pending.reset();
    }
    std::optional<Hash> tip_hash;
    if (const auto tip{current->tip()}; tip && tip->number() > persisted.number) {
        tip_hash = tip->hash();
    }
    STRATA_DEBUG_M("CanonicalInMemoryState: removed persisted blocks",
                   {"persisted", std::to_string(persisted.number), "remaining", std::to_string(blocks.size())});
    publish(std::make_shared<const InMemoryChain>(std::move(blocks), tip_hash, std::move(pending)));
}

CanonStateNotifications CanonicalInMemoryState::subscribe_canon_state(size_t capacity) {
    return CanonStateNotifications{canon_state_signal_, capacity};
}

}  // namespace strata::chain_state
