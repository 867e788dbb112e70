// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>

#include <evmc/evmc.h>
#include <evmc/evmc.hpp>
#include <intx/intx.hpp>

#include <strata/core/chain/config.hpp>
#include <strata/core/common/base.hpp>
#include <strata/core/types/block.hpp>

namespace strata::provider {

//! \brief Chain-level configuration the EVM runs a block with
struct CfgEnv {
    ChainId chain_id{0};
    evmc_revision revision{EVMC_FRONTIER};

    friend bool operator==(const CfgEnv&, const CfgEnv&) = default;
};

//! \brief Block-level context exposed to the EVM
struct BlockEnv {
    BlockNum number{0};
    evmc::address coinbase{};
    BlockTime timestamp{0};
    uint64_t gas_limit{0};
    intx::uint256 base_fee{0};
    intx::uint256 difficulty{0};
    //! EIP-4399: value of the former DIFFICULTY opcode, now PREVRANDAO
    evmc::bytes32 prev_randao{};
    std::optional<uint64_t> excess_blob_gas{std::nullopt};

    friend bool operator==(const BlockEnv&, const BlockEnv&) = default;
};

//! \brief Policy filling the EVM environment out of a header
class EvmEnvConfigurator {
  public:
    virtual ~EvmEnvConfigurator() = default;

    virtual void fill_cfg_env(CfgEnv& cfg, const ChainConfig& config, const BlockHeader& header,
                              const intx::uint256& total_difficulty) const = 0;

    virtual void fill_block_env(BlockEnv& block_env, const BlockHeader& header, bool after_merge) const = 0;

    void fill_cfg_and_block_env(CfgEnv& cfg, BlockEnv& block_env, const ChainConfig& config,
                                const BlockHeader& header, const intx::uint256& total_difficulty) const {
        fill_cfg_env(cfg, config, header, total_difficulty);
        fill_block_env(block_env, header, cfg.revision >= EVMC_PARIS);
    }
};

//! \brief Ethereum mainnet rules: revision from the fork schedule, with the terminal total difficulty marking the Merge
class EthereumEvmEnvConfigurator : public EvmEnvConfigurator {
  public:
    void fill_cfg_env(CfgEnv& cfg, const ChainConfig& config, const BlockHeader& header,
                      const intx::uint256& total_difficulty) const override;

    void fill_block_env(BlockEnv& block_env, const BlockHeader& header, bool after_merge) const override;
};

}  // namespace strata::provider
