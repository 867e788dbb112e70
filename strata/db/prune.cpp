// Copyright 2025 The Strata Authors
// SPDX-License-Identifier: Apache-2.0

#include "prune.hpp"

namespace strata::db {

std::optional<BlockNum> BlockAmount::prune_target(BlockNum stage_head) const {
    switch (type_) {
        case Type::kFull:
            return stage_head;
        case Type::kOlder:  // See Erigon prune mode Distance interface
            if (value_ >= stage_head) return std::nullopt;
            return stage_head - value_;
        case Type::kBefore:  // See Erigon prune mode Before interface
            if (!value_) return std::nullopt;
            return value_ - 1;
    }
    return std::nullopt;
}

std::string BlockAmount::to_string() const {
    switch (type_) {
        case Type::kFull:
            return "full";
        case Type::kOlder:
            return "older=" + std::to_string(value_);
        case Type::kBefore:
            return "before=" + std::to_string(value_);
    }
    return {};
}

}  // namespace strata::db
