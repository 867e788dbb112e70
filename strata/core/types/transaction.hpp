// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/common/base.hpp>
#include <strata/core/common/bytes.hpp>
#include <strata/core/types/hash.hpp>

namespace strata {

// EIP-2930: Optional access lists
struct AccessListEntry {
    evmc::address account{};
    std::vector<evmc::bytes32> storage_keys{};

    friend bool operator==(const AccessListEntry&, const AccessListEntry&) = default;
};

// EIP-2718 transaction type
// https://github.com/ethereum/eth1.0-specs/tree/master/lists/signature-types
enum class TransactionType : uint8_t {
    kLegacy = 0,
    kAccessList = 1,  // EIP-2930
    kDynamicFee = 2,  // EIP-1559
    kBlob = 3,        // EIP-4844
    kSetCode = 4,     // EIP-7702
};

struct UnsignedTransaction {
    TransactionType type{TransactionType::kLegacy};

    std::optional<intx::uint256> chain_id{std::nullopt};  // nullopt means a pre-EIP-155 transaction

    uint64_t nonce{0};
    intx::uint256 max_priority_fee_per_gas{0};  // EIP-1559
    intx::uint256 max_fee_per_gas{0};
    uint64_t gas_limit{0};
    std::optional<evmc::address> to{std::nullopt};
    intx::uint256 value{0};
    Bytes data{};

    std::vector<AccessListEntry> access_list{};  // EIP-2930

    // EIP-4844: Shard Blob Transactions
    intx::uint256 max_fee_per_blob_gas{0};
    std::vector<Hash> blob_versioned_hashes{};

    friend bool operator==(const UnsignedTransaction&, const UnsignedTransaction&) = default;
};

//! \brief Signed transaction payload as stored, without its hash
struct TransactionNoHash : public UnsignedTransaction {
    bool odd_y_parity{false};
    intx::uint256 r{0}, s{0};  // signature

    friend bool operator==(const TransactionNoHash&, const TransactionNoHash&) = default;
};

//! \brief Signed transaction together with its hash
struct Transaction : public TransactionNoHash {
    Hash hash{};

    TransactionNoHash without_hash() const {
        return *this;  // NOLINT(cppcoreguidelines-slicing)
    }

    friend bool operator==(const Transaction&, const Transaction&) = default;
};

//! \brief Location of a transaction within the chain plus the header fields its execution depends on
struct TransactionMeta {
    Hash tx_hash{};
    uint64_t index{0};
    Hash block_hash{};
    BlockNum block_num{0};
    std::optional<intx::uint256> base_fee{std::nullopt};
    std::optional<uint64_t> excess_blob_gas{std::nullopt};
    BlockTime timestamp{0};

    friend bool operator==(const TransactionMeta&, const TransactionMeta&) = default;
};

}  // namespace strata
