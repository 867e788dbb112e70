// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "sample_chain.hpp"

#include <memory>

#include <strata/core/common/empty_hashes.hpp>

namespace strata::test_util {

using chain_state::ExecutedBlock;
using chain_state::ExecutionOutcome;

ChainConfig sample_chain_config() {
    return {
        .chain_id = 1337,
        .homestead_block = 0,
        .tangerine_whistle_block = 0,
        .spurious_dragon_block = 0,
        .byzantium_block = 0,
        .constantinople_block = 0,
        .petersburg_block = 0,
        .istanbul_block = 0,
        .berlin_block = 0,
        .london_block = 0,
        .shanghai_time = kSampleGenesisTime,
        .prague_time = sample_timestamp(kSamplePragueBlockNum),
    };
}

static void store_be64(uint8_t* out, uint64_t value) {
    for (int i{7}; i >= 0; --i) {
        out[i] = static_cast<uint8_t>(value);
        value >>= 8;
    }
}

Hash sample_hash(SampleHashKind kind, uint8_t fork, BlockNum block_num, uint64_t index) {
    Hash hash;
    hash.bytes[0] = static_cast<uint8_t>(kind);
    hash.bytes[1] = fork;
    store_be64(&hash.bytes[8], block_num);
    store_be64(&hash.bytes[16], index);
    hash.bytes[31] = 0x5a;
    return hash;
}

evmc::address sample_address(uint64_t n) {
    evmc::address address;
    address.bytes[0] = 0xaa;
    store_be64(&address.bytes[12], n);
    return address;
}

BlockTime sample_timestamp(BlockNum block_num) {
    return kSampleGenesisTime + block_num * kSampleBlockInterval;
}

evmc::bytes32 sample_slot_value(BlockNum block_num) {
    evmc::bytes32 value;
    store_be64(&value.bytes[24], block_num + 1);
    return value;
}

static ExecutedBlock make_block(BlockNum block_num, const Hash& parent_hash, SampleBlockOptions options) {
    auto block{std::make_shared<SealedBlock>()};
    BlockHeader& header{block->header.header};
    header.parent_hash = parent_hash;
    header.ommers_hash = kEmptyListHash;
    header.beneficiary = kSampleBeneficiary;
    header.transactions_root = options.tx_count == 0 ? kEmptyRoot : sample_hash(SampleHashKind::kTransaction, options.fork, block_num, 1'000);
    header.receipts_root = kEmptyRoot;
    header.difficulty = options.post_merge ? intx::uint256{0} : kSamplePowDifficulty;
    header.number = block_num;
    header.gas_limit = kSampleGasLimit;
    header.gas_used = kSampleTxGas * options.tx_count;
    header.timestamp = sample_timestamp(block_num);
    header.prev_randao = sample_hash(SampleHashKind::kPrevRandao, options.fork, block_num);
    header.base_fee_per_gas = kSampleBaseFeePerGas;
    header.withdrawals_root = kEmptyRoot;
    block->header.hash = sample_hash(SampleHashKind::kBlock, options.fork, block_num);

    auto senders{std::make_shared<std::vector<evmc::address>>()};
    auto outcome{std::make_shared<ExecutionOutcome>()};
    for (size_t i{0}; i < options.tx_count; ++i) {
        Transaction tx;
        tx.type = TransactionType::kDynamicFee;
        tx.chain_id = 1337;
        tx.nonce = block_num * 100 + i;
        tx.max_priority_fee_per_gas = 1;
        tx.max_fee_per_gas = 100;
        tx.gas_limit = kSampleTxGas;
        tx.to = sample_address(0x100 + i);
        tx.value = i + 1;
        tx.hash = sample_hash(SampleHashKind::kTransaction, options.fork, block_num, i);
        block->body.transactions.push_back(std::move(tx));
        senders->push_back(sample_address(0x1000 + i));
        outcome->receipts.push_back(Receipt{
            .type = TransactionType::kDynamicFee,
            .success = true,
            .cumulative_gas_used = kSampleTxGas * (i + 1),
        });
    }
    block->body.withdrawals = std::vector<Withdrawal>{{
        .index = block_num,
        .validator_index = 100 + block_num,
        .address = kSampleWithdrawalAddress,
        .amount = 32,
    }};

    outcome->accounts.emplace(kSampleBeneficiary, Account{.balance = intx::uint256{block_num + 1} * kEther});
    outcome->account_reverts.push_back(AccountBeforeTx{
        .address = kSampleBeneficiary,
        .info = block_num == 0 ? std::nullopt : std::make_optional(Account{.balance = intx::uint256{block_num} * kEther}),
    });
    if (block_num == 0) {
        outcome->accounts.emplace(kSampleContract, Account{.nonce = 1, .code_hash = kSampleCodeHash});
        outcome->code.emplace(kSampleCodeHash, Bytes{0x60, 0x00, 0x54});
        outcome->account_reverts.push_back(AccountBeforeTx{.address = kSampleContract});
    }
    outcome->storage[kSampleContract].slots.emplace(kSampleSlot, sample_slot_value(block_num));
    if (block_num >= kSamplePragueBlockNum) {
        outcome->requests = Requests{Bytes{0x00, static_cast<uint8_t>(block_num)}};
    }

    return ExecutedBlock{std::move(block), std::move(senders), std::move(outcome)};
}

ExecutedBlock sample_genesis(SampleBlockOptions options) {
    return make_block(0, Hash{}, options);
}

ExecutedBlock sample_child(const ExecutedBlock& parent, SampleBlockOptions options) {
    return make_block(parent.number() + 1, parent.hash(), options);
}

std::vector<ExecutedBlock> sample_children(const ExecutedBlock& parent, size_t count, SampleBlockOptions options) {
    std::vector<ExecutedBlock> blocks;
    blocks.reserve(count);
    for (size_t i{0}; i < count; ++i) {
        blocks.push_back(sample_child(i == 0 ? parent : blocks.back(), options));
    }
    return blocks;
}

}  // namespace strata::test_util
