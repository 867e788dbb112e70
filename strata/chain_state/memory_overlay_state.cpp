// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "memory_overlay_state.hpp"

#include <utility>

#include <strata/core/common/assert.hpp>

namespace strata::chain_state {

MemoryOverlayStateView::MemoryOverlayStateView(std::vector<BlockStatePtr> in_memory,
                                               std::unique_ptr<StateView> historical)
    : in_memory_{std::move(in_memory)}, historical_{std::move(historical)} {
    STRATA_ASSERT(historical_ != nullptr);
}

std::optional<Account> MemoryOverlayStateView::read_account(const evmc::address& address) const {
    for (const auto& state : in_memory_) {
        const auto& accounts{state->block().execution_outcome->accounts};
        if (const auto it{accounts.find(address)}; it != accounts.end()) {
            return it->second;
        }
    }
    return historical_->read_account(address);
}

std::optional<evmc::bytes32> MemoryOverlayStateView::read_storage(const evmc::address& address,
                                                                  const evmc::bytes32& location) const {
    // Zero slots read as absent, as in the durable state
    for (const auto& state : in_memory_) {
        const ExecutionOutcome& outcome{*state->block().execution_outcome};
        const auto it{outcome.storage.find(address)};
        if (it != outcome.storage.end()) {
            const StorageChanges& changes{it->second};
            if (const auto slot{changes.slots.find(location)}; slot != changes.slots.end()) {
                if (slot->second == evmc::bytes32{}) return std::nullopt;
                return slot->second;
            }
            if (changes.wiped) return std::nullopt;
        }
        // Destroying an account clears its storage
        if (const auto account{outcome.accounts.find(address)}; account != outcome.accounts.end() && !account->second) {
            return std::nullopt;
        }
    }
    return historical_->read_storage(address, location);
}

std::optional<Bytes> MemoryOverlayStateView::read_code(const evmc::bytes32& code_hash) const {
    for (const auto& state : in_memory_) {
        const auto& code{state->block().execution_outcome->code};
        if (const auto it{code.find(code_hash)}; it != code.end()) {
            return it->second;
        }
    }
    return historical_->read_code(code_hash);
}

std::optional<Hash> MemoryOverlayStateView::block_hash(BlockNum block_num) const {
    for (const auto& state : in_memory_) {
        if (state->number() == block_num) {
            return state->hash();
        }
    }
    return historical_->block_hash(block_num);
}

}  // namespace strata::chain_state
