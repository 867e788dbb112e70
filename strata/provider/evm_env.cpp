// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "evm_env.hpp"

namespace strata::provider {

void EthereumEvmEnvConfigurator::fill_cfg_env(CfgEnv& cfg, const ChainConfig& config, const BlockHeader& header,
                                              const intx::uint256& total_difficulty) const {
    cfg.chain_id = config.chain_id;
    cfg.revision = config.revision(header.number, header.timestamp);
    // EIP-3675: the block reaching the terminal total difficulty is the first one under proof-of-stake rules
    if (cfg.revision < EVMC_PARIS && config.terminal_total_difficulty &&
        total_difficulty >= *config.terminal_total_difficulty) {
        cfg.revision = EVMC_PARIS;
    }
}

void EthereumEvmEnvConfigurator::fill_block_env(BlockEnv& block_env, const BlockHeader& header,
                                                bool after_merge) const {
    block_env.number = header.number;
    block_env.coinbase = header.beneficiary;
    block_env.timestamp = header.timestamp;
    block_env.gas_limit = header.gas_limit;
    block_env.base_fee = header.base_fee_per_gas.value_or(0);
    block_env.excess_blob_gas = header.excess_blob_gas;
    if (after_merge) {
        block_env.prev_randao = header.prev_randao;
        block_env.difficulty = 0;
    } else {
        block_env.prev_randao = evmc::bytes32{};
        intx::be::store(block_env.prev_randao.bytes, header.difficulty);
        block_env.difficulty = header.difficulty;
    }
}

}  // namespace strata::provider
