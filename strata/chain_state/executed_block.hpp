// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <memory>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/core/types/account.hpp>
#include <strata/core/types/block.hpp>
#include <strata/core/types/receipt.hpp>
#include <strata/core/types/request.hpp>

namespace strata::chain_state {

//! \brief Storage slots written by one block for one account
struct StorageChanges {
    //! All slots were cleared before applying the changes (e.g. self-destruct)
    bool wiped{false};
    FlatHashMap<evmc::bytes32, evmc::bytes32> slots;
};

//! \brief Result of executing one block
struct ExecutionOutcome {
    //! Post-state of each touched account, std::nullopt for destroyed ones
    FlatHashMap<evmc::address, std::optional<Account>> accounts;
    FlatHashMap<evmc::address, StorageChanges> storage;
    //! Bytecode deployed by the block, keyed by code hash
    FlatHashMap<evmc::bytes32, Bytes> code;
    //! Pre-state of each account the block changed, in change order
    std::vector<AccountBeforeTx> account_reverts;
    //! One receipt per transaction, in body order
    std::vector<Receipt> receipts;
    //! EIP-7685 requests produced by the block (Prague onwards)
    std::optional<Requests> requests;
};

//! \brief Sealed block plus everything produced by executing it, shared by the overlay and in-flight queries
struct ExecutedBlock {
    std::shared_ptr<const SealedBlock> block;
    std::shared_ptr<const std::vector<evmc::address>> senders;
    std::shared_ptr<const ExecutionOutcome> execution_outcome;

    const SealedBlock& sealed_block() const { return *block; }
    const SealedHeader& sealed_header() const { return block->header; }
    BlockNum number() const { return block->number(); }
    const Hash& hash() const { return block->hash(); }
    const std::vector<Receipt>& receipts() const { return execution_outcome->receipts; }

    SealedBlockWithSenders sealed_block_with_senders() const { return {*block, *senders}; }
    BlockWithSenders block_with_senders() const { return {block->unseal(), *senders}; }
};

}  // namespace strata::chain_state
