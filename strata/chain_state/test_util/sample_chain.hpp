// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <vector>

#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/chain_state/executed_block.hpp>
#include <strata/core/chain/config.hpp>

namespace strata::test_util {

using namespace evmc::literals;

inline constexpr BlockTime kSampleGenesisTime{1'000};
inline constexpr BlockTime kSampleBlockInterval{12};
inline constexpr BlockNum kSamplePragueBlockNum{7};
inline constexpr intx::uint256 kSamplePowDifficulty{131'072};
inline constexpr uint64_t kSampleGasLimit{30'000'000};
inline constexpr uint64_t kSampleTxGas{21'000};
inline constexpr uint64_t kSampleBaseFeePerGas{7};

inline constexpr evmc::address kSampleBeneficiary{0x0715a7794a1dc8e42615f059dd6e406a6594651a_address};
inline constexpr evmc::address kSampleContract{0xe5ef458d37212a06e3f59d40c454e76150ae7c32_address};
inline constexpr evmc::address kSampleWithdrawalAddress{0x8f6b2d6a0aa3b23a4f3b4a6e3c2a5c97a63d8e80_address};
inline constexpr evmc::bytes32 kSampleSlot{0x0000000000000000000000000000000000000000000000000000000000000001_bytes32};
inline constexpr evmc::bytes32 kSampleCodeHash{0xb02a3b0ee16c858afaa34bcd6770b3c20ee56aa2f75858733eb0e927b5b7126e_bytes32};

//! Every block-number fork active from genesis, Shanghai at genesis time, Prague from block kSamplePragueBlockNum
ChainConfig sample_chain_config();

enum class SampleHashKind : uint8_t {
    kBlock = 1,
    kTransaction = 2,
    kPrevRandao = 3,
};

//! \brief Deterministic hash, distinct for every (kind, fork, number, index)
Hash sample_hash(SampleHashKind kind, uint8_t fork, BlockNum block_num, uint64_t index = 0);

evmc::address sample_address(uint64_t n);

BlockTime sample_timestamp(BlockNum block_num);

//! \brief Value written by block N into kSampleSlot of kSampleContract
evmc::bytes32 sample_slot_value(BlockNum block_num);

struct SampleBlockOptions {
    //! Blocks of different forks at the same height have different hashes and transactions
    uint8_t fork{0};
    size_t tx_count{2};
    //! Post-merge blocks carry zero difficulty
    bool post_merge{false};
};

chain_state::ExecutedBlock sample_genesis(SampleBlockOptions options = {});

chain_state::ExecutedBlock sample_child(const chain_state::ExecutedBlock& parent, SampleBlockOptions options = {});

//! \brief count blocks linked above parent, ascending
std::vector<chain_state::ExecutedBlock> sample_children(const chain_state::ExecutedBlock& parent, size_t count,
                                                        SampleBlockOptions options = {});

}  // namespace strata::test_util
