// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/bloom.hpp>
#include <strata/core/types/hash.hpp>
#include <strata/core/types/transaction.hpp>
#include <strata/core/types/withdrawal.hpp>

namespace strata {

using TotalDifficulty = intx::uint256;

struct BlockHeader {
    using NonceType = std::array<uint8_t, 8>;

    evmc::bytes32 parent_hash{};
    evmc::bytes32 ommers_hash{};
    evmc::address beneficiary{};
    evmc::bytes32 state_root{};
    evmc::bytes32 transactions_root{};
    evmc::bytes32 receipts_root{};
    Bloom logs_bloom{};
    intx::uint256 difficulty{};
    uint64_t number{0};
    uint64_t gas_limit{0};
    uint64_t gas_used{0};
    uint64_t timestamp{0};

    Bytes extra_data{};

    evmc::bytes32 prev_randao{};  // mix hash (digest) prior to EIP-4399
    NonceType nonce{};

    // Added in London
    std::optional<intx::uint256> base_fee_per_gas{std::nullopt};  // EIP-1559

    // Added in Shanghai
    std::optional<evmc::bytes32> withdrawals_root{std::nullopt};  // EIP-4895

    // Added in Cancun
    std::optional<uint64_t> blob_gas_used{std::nullopt};                  // EIP-4844
    std::optional<uint64_t> excess_blob_gas{std::nullopt};                // EIP-4844
    std::optional<evmc::bytes32> parent_beacon_block_root{std::nullopt};  // EIP-4788

    // Added in Prague
    std::optional<evmc::bytes32> requests_hash{std::nullopt};  // EIP-7685

    friend bool operator==(const BlockHeader&, const BlockHeader&) = default;
};

//! \brief Header paired with its hash, computed once when the header was sealed
struct SealedHeader {
    BlockHeader header;
    Hash hash{};

    BlockNum number() const { return header.number; }
    const Hash& parent_hash() const { return header.parent_hash; }

    friend bool operator==(const SealedHeader&, const SealedHeader&) = default;
};

struct BlockBody {
    std::vector<Transaction> transactions;
    std::vector<BlockHeader> ommers;
    std::optional<std::vector<Withdrawal>> withdrawals{std::nullopt};

    friend bool operator==(const BlockBody&, const BlockBody&) = default;
};

struct Block : public BlockBody {
    BlockHeader header;

    BlockBody copy_body() const {
        return *this;  // NOLINT(cppcoreguidelines-slicing)
    }

    friend bool operator==(const Block&, const Block&) = default;
};

struct SealedBlock {
    SealedHeader header;
    BlockBody body;

    BlockNum number() const { return header.number(); }
    const Hash& hash() const { return header.hash; }

    Block unseal() const {
        Block block;
        block.header = header.header;
        block.transactions = body.transactions;
        block.ommers = body.ommers;
        block.withdrawals = body.withdrawals;
        return block;
    }

    friend bool operator==(const SealedBlock&, const SealedBlock&) = default;
};

//! \brief Block with the sender recovered for each of its transactions, in body order
struct BlockWithSenders {
    Block block;
    std::vector<evmc::address> senders;

    friend bool operator==(const BlockWithSenders&, const BlockWithSenders&) = default;
};

struct SealedBlockWithSenders {
    SealedBlock block;
    std::vector<evmc::address> senders;

    BlockWithSenders unseal() const { return {block.unseal(), senders}; }

    friend bool operator==(const SealedBlockWithSenders&, const SealedBlockWithSenders&) = default;
};

}  // namespace strata
