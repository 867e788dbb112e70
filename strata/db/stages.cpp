// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "stages.hpp"

namespace strata::db {

std::string_view stage_key(StageId id) {
    switch (id) {
        case StageId::kHeaders:
            return "Headers";
        case StageId::kBlockHashes:
            return "BlockHashes";
        case StageId::kBodies:
            return "Bodies";
        case StageId::kSenders:
            return "Senders";
        case StageId::kExecution:
            return "Execution";
        case StageId::kIntermediateHashes:
            return "IntermediateHashes";
        case StageId::kHashState:
            return "HashState";
        case StageId::kAccountHistoryIndex:
            return "AccountHistoryIndex";
        case StageId::kStorageHistoryIndex:
            return "StorageHistoryIndex";
        case StageId::kLogIndex:
            return "LogIndex";
        case StageId::kCallTraces:
            return "CallTraces";
        case StageId::kTxLookup:
            return "TxLookup";
        case StageId::kFinish:
            return "Finish";
    }
    return "";
}

std::optional<StageId> stage_from_key(std::string_view key) {
    for (const auto id : kAllStages) {
        if (stage_key(id) == key) {
            return id;
        }
    }
    return std::nullopt;
}

}  // namespace strata::db
