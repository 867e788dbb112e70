// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include <strata/core/common/base.hpp>

namespace strata::db {

//! \brief Kind of data the durable store prunes independently
enum class PruneSegment : uint8_t {
    kSenderRecovery,
    kTransactionLookup,
    kReceipts,
    kContractLogs,
    kAccountHistory,
    kStorageHistory,
};

class BlockAmount {
  public:
    enum class Type : uint8_t {
        kFull,   // Prune everything that is prunable
        kOlder,  // Prune Data Older than (moving window)
        kBefore  // Prune data before (fixed)
    };

    BlockAmount() = default;

    explicit BlockAmount(Type type, BlockNum value = 0) : value_{value}, type_{type} {}

    Type type() const { return type_; }
    BlockNum value() const { return value_; }

    //! \brief Highest block number whose data is pruned given the progress of the pruned stage
    //! \return std::nullopt if nothing is pruned yet
    std::optional<BlockNum> prune_target(BlockNum stage_head) const;

    std::string to_string() const;

    friend bool operator==(const BlockAmount&, const BlockAmount&) = default;

  private:
    BlockNum value_{0};
    Type type_{Type::kFull};
};

//! \brief Progress of pruning for one segment
struct PruneCheckpoint {
    //! Highest pruned block, if any
    std::optional<BlockNum> block_num{std::nullopt};
    //! Highest pruned transaction number, if any
    std::optional<TxnId> tx_num{std::nullopt};
    //! Prune mode in effect when the checkpoint was saved
    BlockAmount mode;

    friend bool operator==(const PruneCheckpoint&, const PruneCheckpoint&) = default;
};

}  // namespace strata::db
