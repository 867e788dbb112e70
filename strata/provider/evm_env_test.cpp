// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "evm_env.hpp"

#include <catch2/catch.hpp>

namespace strata::provider {

using namespace evmc::literals;

static ChainConfig london_with_ttd() {
    return {
        .chain_id = 5,
        .homestead_block = 0,
        .tangerine_whistle_block = 0,
        .spurious_dragon_block = 0,
        .byzantium_block = 0,
        .constantinople_block = 0,
        .petersburg_block = 0,
        .istanbul_block = 0,
        .berlin_block = 0,
        .london_block = 0,
        .terminal_total_difficulty = intx::uint256{1'000},
    };
}

static BlockHeader sample_header() {
    return {
        .beneficiary = 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address,
        .difficulty = 0x20000,
        .number = 42,
        .gas_limit = 30'000'000,
        .timestamp = 1'700'000'000,
        .prev_randao = 0x0000000000000000000000000000000000000000000000000000000000000099_bytes32,
        .base_fee_per_gas = 7,
    };
}

TEST_CASE("EthereumEvmEnvConfigurator before the merge") {
    const EthereumEvmEnvConfigurator configurator;
    CfgEnv cfg;
    BlockEnv block_env;
    configurator.fill_cfg_and_block_env(cfg, block_env, london_with_ttd(), sample_header(), intx::uint256{999});

    CHECK(cfg.chain_id == 5);
    CHECK(cfg.revision == EVMC_LONDON);
    CHECK(block_env.number == 42);
    CHECK(block_env.coinbase == 0x0715a7794a1dc8e42615f059dd6e406a6594651a_address);
    CHECK(block_env.timestamp == 1'700'000'000);
    CHECK(block_env.gas_limit == 30'000'000);
    CHECK(block_env.base_fee == 7);
    CHECK(block_env.difficulty == 0x20000);
    // PREVRANDAO carries the difficulty before the merge
    CHECK(block_env.prev_randao == 0x0000000000000000000000000000000000000000000000000000000000020000_bytes32);
    CHECK_FALSE(block_env.excess_blob_gas);
}

TEST_CASE("EthereumEvmEnvConfigurator after the merge") {
    const EthereumEvmEnvConfigurator configurator;
    CfgEnv cfg;
    BlockEnv block_env;

    SECTION("terminal total difficulty reached") {
        configurator.fill_cfg_and_block_env(cfg, block_env, london_with_ttd(), sample_header(), intx::uint256{1'000});
        CHECK(cfg.revision == EVMC_PARIS);
        CHECK(block_env.difficulty == 0);
        CHECK(block_env.prev_randao == 0x0000000000000000000000000000000000000000000000000000000000000099_bytes32);
    }

    SECTION("revision from the fork schedule") {
        ChainConfig config{london_with_ttd()};
        config.shanghai_time = 1'600'000'000;
        config.cancun_time = 1'700'000'000;
        BlockHeader header{sample_header()};
        header.excess_blob_gas = 131'072;
        configurator.fill_cfg_and_block_env(cfg, block_env, config, header, intx::uint256{0});
        CHECK(cfg.revision == EVMC_CANCUN);
        CHECK(block_env.excess_blob_gas == 131'072);
        CHECK(block_env.difficulty == 0);
    }
}

}  // namespace strata::provider
