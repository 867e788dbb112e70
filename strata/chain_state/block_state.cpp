// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "block_state.hpp"

namespace strata::chain_state {

std::optional<std::pair<Transaction, uint64_t>> BlockState::transaction_by_hash(const Hash& tx_hash) const {
    const auto& txs{transactions()};
    for (uint64_t index{0}; index < txs.size(); ++index) {
        if (txs[index].hash == tx_hash) {
            return std::make_pair(txs[index], index);
        }
    }
    return std::nullopt;
}

TransactionMeta BlockState::transaction_meta(uint64_t index) const {
    const auto& h{header()};
    return TransactionMeta{
        .tx_hash = transactions().at(index).hash,
        .index = index,
        .block_hash = hash(),
        .block_num = number(),
        .base_fee = h.base_fee_per_gas,
        .excess_blob_gas = h.excess_blob_gas,
        .timestamp = h.timestamp,
    };
}

}  // namespace strata::chain_state
