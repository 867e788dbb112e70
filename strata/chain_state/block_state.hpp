// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <utility>

#include <strata/chain_state/executed_block.hpp>
#include <strata/core/types/block_id.hpp>

namespace strata::chain_state {

//! \brief One executed block held in memory
//! \details The parent is referenced by its hash only: walks go through repeated lookups in the owning InMemoryChain
class BlockState {
  public:
    explicit BlockState(ExecutedBlock block) : block_{std::move(block)} {}

    const ExecutedBlock& block() const { return block_; }
    const SealedBlock& sealed_block() const { return block_.sealed_block(); }
    const SealedHeader& sealed_header() const { return block_.sealed_header(); }
    const BlockHeader& header() const { return block_.sealed_header().header; }

    BlockNum number() const { return block_.number(); }
    const Hash& hash() const { return block_.hash(); }
    const Hash& parent_hash() const { return header().parent_hash; }
    BlockNumHash num_hash() const { return {number(), hash()}; }

    //! \brief Number and hash of the parent block
    //! \remarks Only meaningful for blocks above genesis
    BlockNumHash parent_num_hash() const { return {number() - 1, parent_hash()}; }

    const std::vector<Transaction>& transactions() const { return sealed_block().body.transactions; }
    const std::vector<Receipt>& receipts() const { return block_.receipts(); }

    //! \brief Transaction with given hash in this block, with its index in the body
    std::optional<std::pair<Transaction, uint64_t>> transaction_by_hash(const Hash& tx_hash) const;

    //! \brief Metadata of the transaction at given index in the body
    TransactionMeta transaction_meta(uint64_t index) const;

  private:
    ExecutedBlock block_;
};

}  // namespace strata::chain_state
