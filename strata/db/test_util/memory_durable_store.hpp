// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

#include <strata/chain_state/executed_block.hpp>
#include <strata/core/common/hash_maps.hpp>
#include <strata/db/storage.hpp>

namespace strata::db::test_util {

//! \brief Whole world state after some block
struct WorldState {
    FlatHashMap<evmc::address, Account> accounts;
    FlatHashMap<evmc::address, FlatHashMap<evmc::bytes32, evmc::bytes32>> storage;
    FlatHashMap<evmc::bytes32, Bytes> code;
};

//! \brief Durable store kept in memory, for tests
//! \details Each write publishes a new immutable copy of the data, so readers opened before it keep their view.
//! Blocks are appended in order and become canonical: block N of the store always has number N.
class MemoryDurableStore : public DurableStore {
  public:
    struct Data {
        std::vector<SealedBlockWithSenders> blocks;
        std::vector<intx::uint256> total_difficulties;
        std::vector<StoredBlockBodyIndices> body_indices;
        std::vector<std::vector<Receipt>> receipts;
        std::vector<std::optional<Requests>> requests;
        std::vector<std::vector<AccountBeforeTx>> changesets;
        std::vector<std::shared_ptr<const WorldState>> states;
        FlatHashMap<Hash, BlockNum> block_numbers;

        // Indexed by global transaction number
        std::vector<Transaction> transactions;
        std::vector<evmc::address> senders;
        std::vector<Receipt> tx_receipts;
        FlatHashMap<Hash, TxnId> tx_lookup;

        std::map<StageId, StageCheckpoint> stage_checkpoints;
        std::map<StageId, Bytes> stage_progress;
        std::map<PruneSegment, PruneCheckpoint> prune_checkpoints;
        std::optional<BlockNum> finalized;
        std::optional<BlockNum> safe;
    };

    explicit MemoryDurableStore(ChainConfig config);

    const ChainConfig& chain_config() const override { return config_; }

    std::unique_ptr<DurableReader> begin_read() const override;

    //! \brief Persists the block right above the current boundary, applying its execution outcome to the state
    //! \throws std::invalid_argument if the block does not extend the last persisted one
    void append(const chain_state::ExecutedBlock& block);

    void set_finalized(std::optional<BlockNum> block_num);
    void set_safe(std::optional<BlockNum> block_num);
    void set_stage_checkpoint(StageId id, StageCheckpoint checkpoint, std::optional<Bytes> progress = std::nullopt);
    void set_prune_checkpoint(PruneSegment segment, PruneCheckpoint checkpoint);

    //! \brief Number of begin_read calls so far
    size_t read_count() const;

  private:
    std::shared_ptr<const Data> data() const;

    template <typename Mutation>
    void write(Mutation&& mutation);

    ChainConfig config_;
    mutable std::mutex mutex_;
    std::shared_ptr<const Data> data_;
    mutable size_t read_count_{0};
};

}  // namespace strata::db::test_util
