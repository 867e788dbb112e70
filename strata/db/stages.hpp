// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <optional>
#include <string_view>

#include <strata/core/common/base.hpp>

/*
    Stages of the staged sync pipeline whose progress the durable store records
*/

namespace strata::db {

enum class StageId : uint8_t {
    kHeaders,
    kBlockHashes,
    kBodies,
    kSenders,
    kExecution,
    kIntermediateHashes,
    kHashState,
    kAccountHistoryIndex,
    kStorageHistoryIndex,
    kLogIndex,
    kCallTraces,
    kTxLookup,
    kFinish,
};

inline constexpr StageId kAllStages[]{
    StageId::kHeaders,
    StageId::kBlockHashes,
    StageId::kBodies,
    StageId::kSenders,
    StageId::kExecution,
    StageId::kIntermediateHashes,
    StageId::kHashState,
    StageId::kAccountHistoryIndex,
    StageId::kStorageHistoryIndex,
    StageId::kLogIndex,
    StageId::kCallTraces,
    StageId::kTxLookup,
    StageId::kFinish,
};

//! \brief Key of the stage in the sync stage table
std::string_view stage_key(StageId id);

std::optional<StageId> stage_from_key(std::string_view key);

//! \brief Highest block a stage has fully processed
struct StageCheckpoint {
    BlockNum block_num{0};

    friend bool operator==(const StageCheckpoint&, const StageCheckpoint&) = default;
};

}  // namespace strata::db
